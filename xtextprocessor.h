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
#ifndef XTEXTPROCESSOR_H
#define XTEXTPROCESSOR_H

#include "xmarginnote.h"

#include <QRegularExpression>

class XTextProcessor {
public:
    struct FEATURES {
        QStringList listHashtags;
        QStringList listLinks;
        QStringList listOtherText;
        QString sFormattedText;
        XMarginNote::TEXTFORMAT textFormat;
        QString sLanguage;
        qint32 nWordCount;
    };

    explicit XTextProcessor(const QString &sLinkScheme = "marginnote4app");

    QString getLinkPrefix() const;
    QString createLink(const QString &sNoteId) const;

    static QStringList extractHashtags(const QString &sText);
    QStringList extractLinks(const QString &sText) const;
    QStringList extractOtherText(const QString &sText) const;
    FEATURES extractFeatures(const QString &sText) const;

    static bool isList(const QStringList &listLines);
    static QString formatText(const QStringList &listLines, XMarginNote::TEXTFORMAT *pTextFormat);
    static qint32 countWords(const QString &sText);
    static QString detectLanguage(const QString &sText);
    static QStringList removeDuplicates(const QStringList &listValues);

    static bool isCJK(QChar cChar);
    static bool isKana(QChar cChar);
    static bool isHangul(QChar cChar);
    static bool isHashtagText(const QString &sText);

private:
    QString g_sLinkPrefix;
    QRegularExpression g_regExpLink;
};

#endif  // XTEXTPROCESSOR_H
