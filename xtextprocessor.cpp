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
#include "xtextprocessor.h"

#include <QSet>

static const ushort FULLWIDTH_NUMBER_SIGN = 0xFF03;

static QList<QRegularExpression> _getListPatterns()
{
    QList<QRegularExpression> listResult;

    listResult.append(QRegularExpression("^\\s*[\\(\\[\\{]?\\d+[\\)\\]\\}\\.: -]+\\s*"));         // 1. 1) (1) [1] 1: 1-
    listResult.append(QRegularExpression("^\\s*[\\(\\[\\{]?[A-Z][\\)\\]\\}\\.: -]+\\s*"));        // A. A) (A)
    listResult.append(QRegularExpression("^\\s*[\\(\\[\\{]?[a-z][\\)\\]\\}\\.: -]+\\s*"));        // a. a) (a)
    listResult.append(QRegularExpression("^\\s*[\\(\\[\\{]?[IVXLCDM]+[\\)\\]\\}\\.: -]+\\s*"));   // I. II) (III)
    listResult.append(QRegularExpression("^\\s*[\\(\\[\\{]?[ivxlcdm]+[\\)\\]\\}\\.: -]+\\s*"));   // i. ii) (iii)
    listResult.append(QRegularExpression(QString("^\\s*[-*%1]\\s+").arg(QChar(0x2022))));        // - * bullet

    return listResult;
}

XTextProcessor::XTextProcessor(const QString &sLinkScheme)
{
    g_sLinkPrefix = QString("%1://note/").arg(sLinkScheme);
    g_regExpLink = QRegularExpression(QString("%1([A-Za-z0-9\\-]+)").arg(QRegularExpression::escape(g_sLinkPrefix)));
}

QString XTextProcessor::getLinkPrefix() const
{
    return g_sLinkPrefix;
}

QString XTextProcessor::createLink(const QString &sNoteId) const
{
    return g_sLinkPrefix + sNoteId;
}

QStringList XTextProcessor::extractHashtags(const QString &sText)
{
    QStringList listResult;

    QRegularExpression regExpTag(QString("[#%1]([^\\s#%1]+)").arg(QChar(FULLWIDTH_NUMBER_SIGN)));
    QRegularExpression regExpLeading(QString("^[#%1]+").arg(QChar(FULLWIDTH_NUMBER_SIGN)));

    QStringList listLines = sText.split('\n');

    qint32 nNumberOfLines = listLines.count();

    for (qint32 i = 0; i < nNumberOfLines; i++) {
        QString sLine = listLines.at(i).trimmed();

        if (isHashtagText(sLine)) {
            // The whole line is one tag
            QString sTag = sLine.remove(regExpLeading).trimmed();

            if (!sTag.isEmpty()) {
                listResult.append(sTag);
            }
        } else {
            QRegularExpressionMatchIterator it = regExpTag.globalMatch(sLine);

            while (it.hasNext()) {
                listResult.append(it.next().captured(1));
            }
        }
    }

    return removeDuplicates(listResult);
}

QStringList XTextProcessor::extractLinks(const QString &sText) const
{
    QStringList listResult;

    QStringList listLines = sText.split('\n');

    qint32 nNumberOfLines = listLines.count();

    for (qint32 i = 0; i < nNumberOfLines; i++) {
        QString sLine = listLines.at(i).trimmed();

        if (sLine.startsWith(g_sLinkPrefix)) {
            QString sNoteId = sLine.mid(g_sLinkPrefix.length());

            if (!sNoteId.isEmpty()) {
                listResult.append(sNoteId);
            }
        } else {
            QRegularExpressionMatchIterator it = g_regExpLink.globalMatch(sLine);

            while (it.hasNext()) {
                listResult.append(it.next().captured(1));
            }
        }
    }

    return removeDuplicates(listResult);
}

QStringList XTextProcessor::extractOtherText(const QString &sText) const
{
    QStringList listResult;

    QStringList listLines = sText.split('\n');

    qint32 nNumberOfLines = listLines.count();

    for (qint32 i = 0; i < nNumberOfLines; i++) {
        QString sLine = listLines.at(i).trimmed();

        if (sLine.isEmpty() || isHashtagText(sLine) || sLine.startsWith(g_sLinkPrefix)) {
            continue;
        }

        listResult.append(listLines.at(i));
    }

    return listResult;
}

XTextProcessor::FEATURES XTextProcessor::extractFeatures(const QString &sText) const
{
    FEATURES result = {};

    result.listHashtags = extractHashtags(sText);
    result.listLinks = extractLinks(sText);
    result.listOtherText = extractOtherText(sText);
    result.sFormattedText = formatText(result.listOtherText, &(result.textFormat));
    result.sLanguage = detectLanguage(sText);
    result.nWordCount = countWords(sText);

    return result;
}

bool XTextProcessor::isList(const QStringList &listLines)
{
    bool bResult = false;

    QList<QRegularExpression> listPatterns = _getListPatterns();

    qint32 nNumberOfLines = 0;
    qint32 nMatchingLines = 0;

    for (qint32 i = 0; i < listLines.count(); i++) {
        QString sLine = listLines.at(i).trimmed();

        if (sLine.isEmpty()) {
            continue;
        }

        nNumberOfLines++;

        for (qint32 j = 0; j < listPatterns.count(); j++) {
            if (listPatterns.at(j).match(sLine).hasMatch()) {
                nMatchingLines++;
                break;
            }
        }
    }

    if (nNumberOfLines >= 2) {
        bResult = ((nMatchingLines * 2) >= nNumberOfLines);
    }

    return bResult;
}

QString XTextProcessor::formatText(const QStringList &listLines, XMarginNote::TEXTFORMAT *pTextFormat)
{
    QString sResult;

    *pTextFormat = XMarginNote::TEXTFORMAT_NONE;

    if (!listLines.isEmpty()) {
        if (isList(listLines)) {
            *pTextFormat = XMarginNote::TEXTFORMAT_LIST;
            sResult = listLines.join("\n");
        } else {
            QStringList listParts;

            for (qint32 i = 0; i < listLines.count(); i++) {
                QString sLine = listLines.at(i).trimmed();

                if (!sLine.isEmpty()) {
                    listParts.append(sLine);
                }
            }

            *pTextFormat = XMarginNote::TEXTFORMAT_PLAIN;
            sResult = listParts.join(" ");
        }
    }

    return sResult;
}

qint32 XTextProcessor::countWords(const QString &sText)
{
    qint32 nResult = 0;

    qint32 nLength = sText.length();

    for (qint32 i = 0; i < nLength; i++) {
        QChar cChar = sText.at(i);

        if (isCJK(cChar) || isKana(cChar) || isHangul(cChar)) {
            nResult++;
        }
    }

    QRegularExpression regExpLatin("\\b[a-zA-Z]+\\b");
    QRegularExpressionMatchIterator it = regExpLatin.globalMatch(sText);

    while (it.hasNext()) {
        it.next();
        nResult++;
    }

    return nResult;
}

QString XTextProcessor::detectLanguage(const QString &sText)
{
    QString sResult = "unknown";

    qint32 nTotal = sText.trimmed().length();

    if (nTotal) {
        qint32 nChinese = 0;
        qint32 nJapanese = 0;
        qint32 nKorean = 0;
        qint32 nLatin = 0;

        qint32 nLength = sText.length();

        for (qint32 i = 0; i < nLength; i++) {
            QChar cChar = sText.at(i);
            ushort nCode = cChar.unicode();

            if (isCJK(cChar)) {
                nChinese++;
            } else if (isKana(cChar)) {
                nJapanese++;
            } else if (isHangul(cChar)) {
                nKorean++;
            } else if (((nCode >= 'a') && (nCode <= 'z')) || ((nCode >= 'A') && (nCode <= 'Z'))) {
                nLatin++;
            }
        }

        // Ties resolve in this order
        qint32 nMax = nChinese;
        sResult = "zh";

        if (nJapanese > nMax) {
            nMax = nJapanese;
            sResult = "ja";
        }

        if (nKorean > nMax) {
            nMax = nKorean;
            sResult = "ko";
        }

        if (nLatin > nMax) {
            nMax = nLatin;
            sResult = "en";
        }

        double dRatio = (double)nMax / nTotal;

        if (dRatio < 0.1) {
            sResult = "unknown";
        } else if (dRatio < 0.5) {
            sResult = "mixed";
        }
    }

    return sResult;
}

QStringList XTextProcessor::removeDuplicates(const QStringList &listValues)
{
    QStringList listResult;
    QSet<QString> stSeen;

    qint32 nNumberOfValues = listValues.count();

    for (qint32 i = 0; i < nNumberOfValues; i++) {
        if (!stSeen.contains(listValues.at(i))) {
            stSeen.insert(listValues.at(i));
            listResult.append(listValues.at(i));
        }
    }

    return listResult;
}

bool XTextProcessor::isCJK(QChar cChar)
{
    ushort nCode = cChar.unicode();

    return ((nCode >= 0x4E00) && (nCode <= 0x9FFF)) || ((nCode >= 0x3400) && (nCode <= 0x4DBF)) || ((nCode >= 0xF900) && (nCode <= 0xFAFF));
}

bool XTextProcessor::isKana(QChar cChar)
{
    ushort nCode = cChar.unicode();

    return (nCode >= 0x3040) && (nCode <= 0x30FF);
}

bool XTextProcessor::isHangul(QChar cChar)
{
    ushort nCode = cChar.unicode();

    return (nCode >= 0xAC00) && (nCode <= 0xD7AF);
}

bool XTextProcessor::isHashtagText(const QString &sText)
{
    return sText.startsWith('#') || sText.startsWith(QChar(FULLWIDTH_NUMBER_SIGN));
}
