/* Copyright (c) 2025 hors<horsicq@gmail.com>
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */
#ifndef XNOTEEXPORTER_H
#define XNOTEEXPORTER_H

#include "xmarginnote.h"

#include <QJsonObject>
#include <QObject>

class XNoteExporter : public QObject {
    Q_OBJECT

public:
    enum FILENAME {
        FILENAME_TITLE = 0,
        FILENAME_NOTEID,
        FILENAME_TITLEANDID
    };

    struct OPTIONS {
        bool bExcerpt;
        bool bNotes;
        bool bHashtags;
        bool bLinks;
        bool bOtherText;
        bool bHighlights;
        bool bMedia;
        bool bMetadata;
        FILENAME fileName;
        qint32 nMaxFileNameLength;

        OPTIONS()
        {
            bExcerpt = true;
            bNotes = true;
            bHashtags = true;
            bLinks = true;
            bOtherText = true;
            bHighlights = false;
            bMedia = true;
            bMetadata = true;
            fileName = FILENAME_TITLEANDID;
            nMaxFileNameLength = 100;
        }
    };

    explicit XNoteExporter(QObject *parent = nullptr);

    void setOptions(const OPTIONS &options);
    OPTIONS getOptions() const;

    virtual QString getFileExtension() const = 0;
    virtual QByteArray render(const XMarginNote::CONTENTGROUP &group, const XMarginNote::TOPICMAP &mapTopics) = 0;

    QString getFileName(const XMarginNote::CONTENTGROUP &group) const;
    static QString sanitizeFileName(const QString &sName, qint32 nMaxLength);

signals:
    void errorMessage(const QString &sText);
    void warningMessage(const QString &sText);

protected:
    OPTIONS g_options;
};

class XJsonNoteExporter : public XNoteExporter {
    Q_OBJECT

public:
    explicit XJsonNoteExporter(QObject *parent = nullptr);

    virtual QString getFileExtension() const;
    virtual QByteArray render(const XMarginNote::CONTENTGROUP &group, const XMarginNote::TOPICMAP &mapTopics);

    QJsonObject toJsonObject(const XMarginNote::CONTENTGROUP &group, const XMarginNote::TOPICMAP &mapTopics) const;
};

#endif  // XNOTEEXPORTER_H
