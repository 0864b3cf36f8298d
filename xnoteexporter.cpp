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
#include "xnoteexporter.h"

#include <QJsonArray>
#include <QJsonDocument>

XNoteExporter::XNoteExporter(QObject *parent) : QObject(parent)
{
}

void XNoteExporter::setOptions(const OPTIONS &options)
{
    g_options = options;
}

XNoteExporter::OPTIONS XNoteExporter::getOptions() const
{
    return g_options;
}

QString XNoteExporter::getFileName(const XMarginNote::CONTENTGROUP &group) const
{
    QString sResult;

    const XMarginNote::NOTERECORD &noteRecord = group.masterNote;

    QString sTitle = noteRecord.sNoteTitle.trimmed();

    if (sTitle.isEmpty()) {
        sTitle = noteRecord.sExcerptText.trimmed().section('\n', 0, 0);
    }

    switch (g_options.fileName) {
        case FILENAME_TITLE: sResult = sTitle; break;
        case FILENAME_NOTEID: sResult = noteRecord.sNoteId; break;
        case FILENAME_TITLEANDID: sResult = sTitle.isEmpty() ? noteRecord.sNoteId : QString("%1 (%2)").arg(sTitle, noteRecord.sNoteId); break;
    }

    sResult = sanitizeFileName(sResult, g_options.nMaxFileNameLength);

    if (sResult.isEmpty()) {
        sResult = sanitizeFileName(noteRecord.sNoteId, g_options.nMaxFileNameLength);
    }

    return sResult + "." + getFileExtension();
}

QString XNoteExporter::sanitizeFileName(const QString &sName, qint32 nMaxLength)
{
    QString sResult;

    qint32 nLength = sName.length();

    for (qint32 i = 0; i < nLength; i++) {
        QChar cChar = sName.at(i);

        if ((cChar.unicode() < 0x20) || QString("\\/:*?\"<>|#^[]").contains(cChar)) {
            sResult.append('_');
        } else {
            sResult.append(cChar);
        }
    }

    sResult = sResult.simplified();

    if ((nMaxLength > 0) && (sResult.length() > nMaxLength)) {
        sResult = sResult.left(nMaxLength).trimmed();
    }

    while (sResult.startsWith('.')) {
        sResult.remove(0, 1);
    }

    return sResult;
}

XJsonNoteExporter::XJsonNoteExporter(QObject *parent) : XNoteExporter(parent)
{
}

QString XJsonNoteExporter::getFileExtension() const
{
    return "json";
}

QByteArray XJsonNoteExporter::render(const XMarginNote::CONTENTGROUP &group, const XMarginNote::TOPICMAP &mapTopics)
{
    QJsonDocument jsonDoc(toJsonObject(group, mapTopics));

    return jsonDoc.toJson(QJsonDocument::Indented);
}

QJsonObject XJsonNoteExporter::toJsonObject(const XMarginNote::CONTENTGROUP &group, const XMarginNote::TOPICMAP &mapTopics) const
{
    QJsonObject jsonResult;

    const XMarginNote::NOTERECORD &noteRecord = group.masterNote;

    jsonResult.insert("noteId", noteRecord.sNoteId);

    if (!noteRecord.sNoteTitle.isEmpty()) {
        jsonResult.insert("title", noteRecord.sNoteTitle);
    }

    if (g_options.bExcerpt && (!noteRecord.sExcerptText.isEmpty())) {
        jsonResult.insert("excerpt", noteRecord.sExcerptText);
    }

    if (g_options.bNotes && (!noteRecord.sNotesText.isEmpty())) {
        jsonResult.insert("notes", noteRecord.sNotesText);
    }

    if (g_options.bHashtags) {
        jsonResult.insert("hashtags", QJsonArray::fromStringList(noteRecord.listHashtags));
    }

    if (g_options.bLinks) {
        jsonResult.insert("links", QJsonArray::fromStringList(noteRecord.listLinks));
    }

    if (g_options.bOtherText && (!noteRecord.sFormattedText.isEmpty())) {
        QJsonObject jsonText;
        jsonText.insert("format", XMarginNote::textFormatToString(noteRecord.textFormat));
        jsonText.insert("text", noteRecord.sFormattedText);

        jsonResult.insert("otherText", jsonText);
    }

    if (g_options.bHighlights) {
        QJsonArray jsonHighlights;

        for (qint32 i = 0; i < noteRecord.listHighlights.count(); i++) {
            const XMarginNote::HIGHLIGHT &highlight = noteRecord.listHighlights.at(i);

            QJsonObject jsonHighlight;
            jsonHighlight.insert("text", highlight.sText);
            jsonHighlight.insert("coordsHash", highlight.sCoordsHash);
            jsonHighlight.insert("selections", (qint32)highlight.listSelections.count());

            jsonHighlights.append(jsonHighlight);
        }

        jsonResult.insert("highlights", jsonHighlights);

        if (noteRecord.excerptRegion.bIsValid) {
            QJsonObject jsonRegion;
            jsonRegion.insert("pageNo", noteRecord.excerptRegion.nPageNo);
            jsonRegion.insert("x", noteRecord.excerptRegion.rect.dX);
            jsonRegion.insert("y", noteRecord.excerptRegion.rect.dY);
            jsonRegion.insert("width", noteRecord.excerptRegion.rect.dWidth);
            jsonRegion.insert("height", noteRecord.excerptRegion.rect.dHeight);

            jsonResult.insert("excerptRegion", jsonRegion);
        }
    }

    if (g_options.bMedia) {
        QJsonArray jsonMedia;

        for (qint32 i = 0; i < noteRecord.listMedia.count(); i++) {
            QJsonObject jsonAttachment;
            jsonAttachment.insert("hash", noteRecord.listMedia.at(i).sMediaHash);
            jsonAttachment.insert("type", XMarginNote::mediaTypeToString(noteRecord.listMedia.at(i).mediaType));

            jsonMedia.append(jsonAttachment);
        }

        jsonResult.insert("media", jsonMedia);
    }

    if (g_options.bMetadata) {
        QJsonObject jsonMetadata;

        jsonMetadata.insert("groupType", XMarginNote::topicTypeToString(group.groupType));
        jsonMetadata.insert("members", QJsonArray::fromStringList(group.listNoteIds));

        if (!noteRecord.sTopicId.isEmpty()) {
            jsonMetadata.insert("topicId", noteRecord.sTopicId);

            XMarginNote::TOPICMAP::const_iterator iter = mapTopics.constFind(noteRecord.sTopicId);

            if (iter != mapTopics.constEnd()) {
                jsonMetadata.insert("topic", iter.value().sTitle);
            }
        }

        if (noteRecord.dtNoteDate.isValid()) {
            jsonMetadata.insert("created", noteRecord.dtNoteDate.toString(Qt::ISODate));
        }

        if (noteRecord.dtHighlightDate.isValid()) {
            jsonMetadata.insert("highlighted", noteRecord.dtHighlightDate.toString(Qt::ISODate));
        }

        if (noteRecord.nStartPage || noteRecord.nEndPage) {
            jsonMetadata.insert("startPage", noteRecord.nStartPage);
            jsonMetadata.insert("endPage", noteRecord.nEndPage);
        }

        jsonMetadata.insert("wordCount", noteRecord.nWordCount);
        jsonMetadata.insert("language", noteRecord.sLanguage);

        jsonResult.insert("metadata", jsonMetadata);
    }

    return jsonResult;
}
