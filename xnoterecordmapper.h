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
#ifndef XNOTERECORDMAPPER_H
#define XNOTERECORDMAPPER_H

#include "xkeyedarchiver.h"
#include "xmarginnote.h"
#include "xmediadecoder.h"
#include "xtextprocessor.h"

#include <QObject>

class XNoteRecordMapper : public QObject {
    Q_OBJECT

public:
    struct OPTIONS {
        bool bStrictDecoding;
        QString sLinkScheme;
        qint32 nMaxResolveDepth;

        OPTIONS()
        {
            bStrictDecoding = false;
            sLinkScheme = "marginnote4app";
            nMaxResolveDepth = 512;
        }
    };

    struct COUNTERS {
        qint32 nNotesMapped;
        qint32 nNotesSkipped;
        qint32 nTopicsMapped;
        qint32 nTopicsSkipped;
        qint32 nMediaMapped;
        qint32 nMediaSkipped;
        qint32 nDecodeWarnings;
    };

    explicit XNoteRecordMapper(QObject *parent = nullptr);

    void setOptions(const OPTIONS &options);
    OPTIONS getOptions() const;

    bool decodeBlob(const QByteArray &baData, QVariant *pvarResult);

    bool mapNote(const QVariantMap &mapRow, const XMarginNote::MEDIAMAP &mapMedia, XMarginNote::NOTERECORD *pRecord);
    bool mapNote(const QVariantMap &mapRow, const QVariant &varNotesData, const QVariant &varHighlightsData, const XMarginNote::MEDIAMAP &mapMedia,
                 XMarginNote::NOTERECORD *pRecord);
    bool mapTopic(const QVariantMap &mapRow, XMarginNote::TOPICRECORD *pRecord);
    bool mapMedia(const QVariantMap &mapRow, XMarginNote::MEDIARECORD *pRecord);

    QList<XMarginNote::NOTERECORD> mapNotes(const QList<QVariantMap> &listRows, const XMarginNote::MEDIAMAP &mapMedia);
    XMarginNote::TOPICMAP mapTopics(const QList<QVariantMap> &listRows);
    XMarginNote::MEDIAMAP mapMediaRows(const QList<QVariantMap> &listRows);

    COUNTERS getCounters() const;
    void resetCounters();
    bool isStrictFailure() const;
    QString getErrorString() const;

    static QString getString(const QVariantMap &mapRow, const QString &sColumn);
    static QString getString(const QVariantMap &mapRow, const QStringList &listColumns);
    static QDateTime toDateTime(const QVariant &varValue);
    static bool parseRect(const QVariant &varValue, XMarginNote::RECT *pRect);
    static QStringList parseMediaList(const QString &sMediaList);
    static XMarginNote::TOPICTYPE classifyTopic(const QVariant &varOwner, const QByteArray &baOwner);

private:
    static QVariantList _toList(const QVariant &varValue);
    static QString _toText(const QVariant &varValue);
    void _applyNotesData(const QVariant &varNotesData, const XTextProcessor &textProcessor, XMarginNote::NOTERECORD *pRecord, QStringList *pListTexts);
    void _applyHighlightsData(const QVariant &varHighlightsData, XMarginNote::NOTERECORD *pRecord);
    static bool _readRegion(const QVariant &varValue, XMarginNote::EXCERPTREGION *pRegion);

signals:
    void errorMessage(const QString &sText);
    void warningMessage(const QString &sText);

private:
    OPTIONS g_options;
    COUNTERS g_counters;
    bool g_bStrictFailure;
    QString g_sErrorString;
};

#endif  // XNOTERECORDMAPPER_H
