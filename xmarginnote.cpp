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
#include "xmarginnote.h"

bool XMarginNote::isMerged(const NOTERECORD &noteRecord)
{
    return !noteRecord.sGroupNoteId.isEmpty();
}

bool XMarginNote::isOriginal(const NOTERECORD &noteRecord)
{
    return noteRecord.sGroupNoteId.isEmpty();
}

bool XMarginNote::hasContent(const NOTERECORD &noteRecord)
{
    return (!noteRecord.sExcerptText.trimmed().isEmpty()) || (!noteRecord.sNotesText.trimmed().isEmpty()) || (!noteRecord.sNoteTitle.trimmed().isEmpty()) ||
           (!noteRecord.listOtherText.isEmpty()) || (!noteRecord.listHashtags.isEmpty()) || (!noteRecord.listMedia.isEmpty());
}

QString XMarginNote::getAllText(const NOTERECORD &noteRecord)
{
    QStringList listTexts;

    listTexts.append(noteRecord.sExcerptText);
    listTexts.append(noteRecord.sNotesText);
    listTexts.append(noteRecord.sNoteTitle);
    listTexts.append(noteRecord.listOtherText);

    QStringList listResult;

    qint32 nNumberOfTexts = listTexts.count();

    for (qint32 i = 0; i < nNumberOfTexts; i++) {
        if (!listTexts.at(i).trimmed().isEmpty()) {
            listResult.append(listTexts.at(i));
        }
    }

    return listResult.join("\n");
}

QString XMarginNote::topicTypeToString(TOPICTYPE topicType)
{
    QString sResult = "unknown";

    switch (topicType) {
        case TOPICTYPE_PROJECT: sResult = "project"; break;
        case TOPICTYPE_BOOK: sResult = "book"; break;
        case TOPICTYPE_REVIEWTOPIC: sResult = "reviewTopic"; break;
        case TOPICTYPE_GENERAL: sResult = "general"; break;
        default: break;
    }

    return sResult;
}

QString XMarginNote::mediaTypeToString(MEDIATYPE mediaType)
{
    QString sResult = "unknown";

    switch (mediaType) {
        case MEDIATYPE_IMAGE: sResult = "image"; break;
        case MEDIATYPE_INK: sResult = "ink"; break;
        case MEDIATYPE_COORDINATES: sResult = "coordinates"; break;
        case MEDIATYPE_BINARY: sResult = "binary"; break;
        default: break;
    }

    return sResult;
}

QString XMarginNote::textFormatToString(TEXTFORMAT textFormat)
{
    QString sResult = "none";

    switch (textFormat) {
        case TEXTFORMAT_PLAIN: sResult = "plain"; break;
        case TEXTFORMAT_LIST: sResult = "list"; break;
        default: break;
    }

    return sResult;
}

QString XMarginNote::errorTypeToString(ERRORTYPE errorType)
{
    QString sResult;

    switch (errorType) {
        case ERRORTYPE_NONE: sResult = QString("None"); break;
        case ERRORTYPE_CONTAINERFORMAT: sResult = QString("Container format"); break;
        case ERRORTYPE_ENTRYEXTRACTION: sResult = QString("Entry extraction"); break;
        case ERRORTYPE_PLISTDECODE: sResult = QString("Property list decode"); break;
        case ERRORTYPE_ARCHIVERVALIDATION: sResult = QString("Archiver validation"); break;
        case ERRORTYPE_ROWMAPPING: sResult = QString("Row mapping"); break;
        case ERRORTYPE_GROUPINGINVARIANT: sResult = QString("Grouping invariant"); break;
        case ERRORTYPE_DATABASE: sResult = QString("Database"); break;
    }

    return sResult;
}
