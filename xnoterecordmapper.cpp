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
#include "xnoterecordmapper.h"

#include <QJsonDocument>
#include <QSet>

XNoteRecordMapper::XNoteRecordMapper(QObject *parent) : QObject(parent)
{
    g_counters = {};
    g_bStrictFailure = false;
}

void XNoteRecordMapper::setOptions(const OPTIONS &options)
{
    g_options = options;
}

XNoteRecordMapper::OPTIONS XNoteRecordMapper::getOptions() const
{
    return g_options;
}

bool XNoteRecordMapper::decodeBlob(const QByteArray &baData, QVariant *pvarResult)
{
    bool bResult = true;

    *pvarResult = QVariant();

    if (baData.isEmpty()) {
        return true;
    }

    QByteArray baTrimmed = baData.trimmed();

    if ((!XBPList::isValid(baData)) && (baTrimmed.startsWith('{') || baTrimmed.startsWith('['))) {
        // Some builds store these columns as JSON
        QJsonParseError jsonError;
        QJsonDocument jsonDoc = QJsonDocument::fromJson(baTrimmed, &jsonError);

        if (jsonError.error == QJsonParseError::NoError) {
            *pvarResult = jsonDoc.toVariant();

            return true;
        }
    }

    XKeyedArchiver::OPTIONS archiverOptions;
    archiverOptions.bStrict = g_options.bStrictDecoding;
    archiverOptions.nMaxDepth = g_options.nMaxResolveDepth;

    XKeyedArchiver keyedArchiver;
    keyedArchiver.setOptions(archiverOptions);

    connect(&keyedArchiver, SIGNAL(errorMessage(QString)), this, SIGNAL(errorMessage(QString)));
    connect(&keyedArchiver, SIGNAL(warningMessage(QString)), this, SIGNAL(warningMessage(QString)));

    QVariant varDecoded;
    XKeyedArchiver::DECODE_RESULT decodeResult = keyedArchiver.decode(baData, &varDecoded);

    switch (decodeResult) {
        case XKeyedArchiver::DECODE_RESULT_OK: *pvarResult = varDecoded; break;
        case XKeyedArchiver::DECODE_RESULT_EMPTY: break;
        case XKeyedArchiver::DECODE_RESULT_NOTARCHIVE: break;
        case XKeyedArchiver::DECODE_RESULT_DEGRADED:
        case XKeyedArchiver::DECODE_RESULT_PLISTERROR:
        case XKeyedArchiver::DECODE_RESULT_CYCLE:
            if (g_options.bStrictDecoding) {
                g_sErrorString = keyedArchiver.getErrorString();

                if (g_sErrorString.isEmpty()) {
                    g_sErrorString = tr("Damaged property list");
                }

                g_bStrictFailure = true;
                bResult = false;
            } else {
                g_counters.nDecodeWarnings++;
            }
            break;
    }

    if (bResult && (decodeResult == XKeyedArchiver::DECODE_RESULT_DEGRADED)) {
        // Keys and class names are mixed into the scan, only tags and note links are trusted
        XTextProcessor textProcessor(g_options.sLinkScheme);

        QVariantList listScanned = varDecoded.toList();
        QVariantList listTexts;

        for (qint32 i = 0; i < listScanned.count(); i++) {
            if (listScanned.at(i).userType() == QMetaType::QString) {
                QString sText = listScanned.at(i).toString().trimmed();

                if (XTextProcessor::isHashtagText(sText) || sText.startsWith(textProcessor.getLinkPrefix())) {
                    listTexts.append(sText);
                }
            }
        }

        *pvarResult = listTexts;
    }

    if (bResult && keyedArchiver.getCycleCount() && (decodeResult == XKeyedArchiver::DECODE_RESULT_OK)) {
        // Resolved with the cyclic references cut
        g_counters.nDecodeWarnings++;
    }

    return bResult;
}

bool XNoteRecordMapper::mapNote(const QVariantMap &mapRow, const XMarginNote::MEDIAMAP &mapMedia, XMarginNote::NOTERECORD *pRecord)
{
    bool bResult = false;

    QVariant varNotesData;
    QVariant varHighlightsData;

    if (decodeBlob(mapRow.value("ZNOTES").toByteArray(), &varNotesData) && decodeBlob(mapRow.value("ZHIGHLIGHTS").toByteArray(), &varHighlightsData)) {
        bResult = mapNote(mapRow, varNotesData, varHighlightsData, mapMedia, pRecord);
    }

    return bResult;
}

bool XNoteRecordMapper::mapNote(const QVariantMap &mapRow, const QVariant &varNotesData, const QVariant &varHighlightsData, const XMarginNote::MEDIAMAP &mapMedia,
                                XMarginNote::NOTERECORD *pRecord)
{
    bool bResult = false;

    *pRecord = XMarginNote::NOTERECORD();

    pRecord->sNoteId = getString(mapRow, "ZNOTEID").trimmed();

    if (pRecord->sNoteId.isEmpty()) {
        g_sErrorString = tr("Note row without identifier");
        return false;
    }

    pRecord->sTopicId = getString(mapRow, "ZTOPICID");
    pRecord->sGroupNoteId = getString(mapRow, "ZGROUPNOTEID").trimmed();
    pRecord->sExternalId = getString(mapRow, QStringList() << "ZEVERNOTEID"
                                                           << "ZEVERNOTE_ID")
                               .trimmed();
    pRecord->sExcerptText = getString(mapRow, "ZHIGHLIGHT_TEXT");
    pRecord->sNotesText = getString(mapRow, "ZNOTES_TEXT");
    pRecord->sNoteTitle = getString(mapRow, QStringList() << "ZNOTETITLE"
                                                          << "ZTITLE"
                                                          << "ZNOTE_TITLE");
    pRecord->sAuthor = getString(mapRow, "ZAUTHOR");
    pRecord->nStartPage = mapRow.value("ZSTARTPAGE").toInt();
    pRecord->nEndPage = mapRow.value("ZENDPAGE").toInt();
    pRecord->dtNoteDate = toDateTime(mapRow.value("ZNOTE_DATE"));
    pRecord->dtHighlightDate = toDateTime(mapRow.value("ZHIGHLIGHT_DATE"));
    pRecord->varNotesData = varNotesData;
    pRecord->varHighlightsData = varHighlightsData;

    // Region stored with the row itself
    QVariant varPicture;

    if (!decodeBlob(mapRow.value("ZHIGHLIGHT_PIC").toByteArray(), &varPicture)) {
        return false;
    }

    _readRegion(varPicture, &(pRecord->excerptRegion));

    QStringList listMediaHashes = parseMediaList(getString(mapRow, "ZMEDIA_LIST"));

    for (qint32 i = 0; i < listMediaHashes.count(); i++) {
        XMarginNote::MEDIAATTACHMENT attachment = {};
        attachment.sMediaHash = listMediaHashes.at(i);
        attachment.mediaType = mapMedia.value(attachment.sMediaHash).mediaType;

        if (!mapMedia.contains(attachment.sMediaHash)) {
            attachment.mediaType = XMarginNote::MEDIATYPE_UNKNOWN;
        }

        pRecord->listMedia.append(attachment);
    }

    _applyHighlightsData(varHighlightsData, pRecord);

    XTextProcessor textProcessor(g_options.sLinkScheme);

    QStringList listExtraTexts;
    _applyNotesData(varNotesData, textProcessor, pRecord, &listExtraTexts);

    QString sExtraText = listExtraTexts.join("\n");
    QString sAllText = XMarginNote::getAllText(*pRecord);

    if (!sExtraText.isEmpty()) {
        sAllText += "\n" + sExtraText;
    }

    XTextProcessor::FEATURES features = textProcessor.extractFeatures(sAllText);

    pRecord->listHashtags = features.listHashtags;

    QStringList listLinks;

    for (qint32 i = 0; i < pRecord->listLinkedNotes.count(); i++) {
        listLinks.append(pRecord->listLinkedNotes.at(i).sNoteId);
    }

    listLinks.append(features.listLinks);

    pRecord->listLinks = XTextProcessor::removeDuplicates(listLinks);
    pRecord->listOtherText = features.listOtherText;
    pRecord->sFormattedText = features.sFormattedText;
    pRecord->textFormat = features.textFormat;
    pRecord->nWordCount = features.nWordCount;
    pRecord->sLanguage = features.sLanguage;

    bResult = true;

    return bResult;
}

bool XNoteRecordMapper::mapTopic(const QVariantMap &mapRow, XMarginNote::TOPICRECORD *pRecord)
{
    bool bResult = false;

    *pRecord = XMarginNote::TOPICRECORD();

    pRecord->sTopicId = getString(mapRow, "ZTOPICID").trimmed();

    if (!pRecord->sTopicId.isEmpty()) {
        pRecord->sTitle = getString(mapRow, "ZTITLE");
        pRecord->sParentTopicId = getString(mapRow, "ZPARENT_TOPIC");
        pRecord->dtCreateDate = toDateTime(mapRow.value("ZCREATE_DATE"));
        pRecord->dtModifyDate = toDateTime(mapRow.value("ZMODIFY_DATE"));

        QByteArray baOwner = mapRow.value("ZFORUMOWNER").toByteArray();
        QVariant varOwner;

        if (decodeBlob(baOwner, &varOwner)) {
            pRecord->topicType = classifyTopic(varOwner, baOwner);
            bResult = true;
        }
    } else {
        g_sErrorString = tr("Topic row without identifier");
    }

    return bResult;
}

bool XNoteRecordMapper::mapMedia(const QVariantMap &mapRow, XMarginNote::MEDIARECORD *pRecord)
{
    bool bResult = false;

    QString sMediaHash = getString(mapRow, "ZMD5").trimmed();

    if (!sMediaHash.isEmpty()) {
        *pRecord = XMediaDecoder::decode(sMediaHash, mapRow.value("ZDATA").toByteArray());
        bResult = true;
    } else {
        g_sErrorString = tr("Media row without hash");
    }

    return bResult;
}

QList<XMarginNote::NOTERECORD> XNoteRecordMapper::mapNotes(const QList<QVariantMap> &listRows, const XMarginNote::MEDIAMAP &mapMedia)
{
    QList<XMarginNote::NOTERECORD> listResult;
    QSet<QString> stNoteIds;

    qint32 nNumberOfRows = listRows.count();

    for (qint32 i = 0; (i < nNumberOfRows) && (!g_bStrictFailure); i++) {
        XMarginNote::NOTERECORD record;

        if (mapNote(listRows.at(i), mapMedia, &record)) {
            if (!stNoteIds.contains(record.sNoteId)) {
                stNoteIds.insert(record.sNoteId);
                listResult.append(record);
                g_counters.nNotesMapped++;
            } else {
                emit warningMessage(tr("Duplicate note %1").arg(record.sNoteId));
                g_counters.nNotesSkipped++;
            }
        } else {
            emit warningMessage(tr("Cannot map note row %1: %2").arg(i).arg(g_sErrorString));
            g_counters.nNotesSkipped++;
        }
    }

    return listResult;
}

XMarginNote::TOPICMAP XNoteRecordMapper::mapTopics(const QList<QVariantMap> &listRows)
{
    XMarginNote::TOPICMAP mapResult;

    qint32 nNumberOfRows = listRows.count();

    for (qint32 i = 0; (i < nNumberOfRows) && (!g_bStrictFailure); i++) {
        XMarginNote::TOPICRECORD record;

        if (mapTopic(listRows.at(i), &record)) {
            mapResult.insert(record.sTopicId, record);
            g_counters.nTopicsMapped++;
        } else {
            emit warningMessage(tr("Cannot map topic row %1: %2").arg(i).arg(g_sErrorString));
            g_counters.nTopicsSkipped++;
        }
    }

    return mapResult;
}

XMarginNote::MEDIAMAP XNoteRecordMapper::mapMediaRows(const QList<QVariantMap> &listRows)
{
    XMarginNote::MEDIAMAP mapResult;

    qint32 nNumberOfRows = listRows.count();

    for (qint32 i = 0; i < nNumberOfRows; i++) {
        XMarginNote::MEDIARECORD record;

        if (mapMedia(listRows.at(i), &record)) {
            mapResult.insert(record.sMediaHash, record);
            g_counters.nMediaMapped++;
        } else {
            emit warningMessage(tr("Cannot map media row %1: %2").arg(i).arg(g_sErrorString));
            g_counters.nMediaSkipped++;
        }
    }

    return mapResult;
}

XNoteRecordMapper::COUNTERS XNoteRecordMapper::getCounters() const
{
    return g_counters;
}

void XNoteRecordMapper::resetCounters()
{
    g_counters = {};
    g_bStrictFailure = false;
    g_sErrorString.clear();
}

bool XNoteRecordMapper::isStrictFailure() const
{
    return g_bStrictFailure;
}

QString XNoteRecordMapper::getErrorString() const
{
    return g_sErrorString;
}

QString XNoteRecordMapper::getString(const QVariantMap &mapRow, const QString &sColumn)
{
    QString sResult;

    QVariant varValue = mapRow.value(sColumn);

    if (varValue.userType() == QMetaType::QByteArray) {
        sResult = QString::fromUtf8(varValue.toByteArray());
    } else if (varValue.isValid()) {
        sResult = varValue.toString();
    }

    return sResult;
}

QString XNoteRecordMapper::getString(const QVariantMap &mapRow, const QStringList &listColumns)
{
    QString sResult;

    for (qint32 i = 0; i < listColumns.count(); i++) {
        sResult = getString(mapRow, listColumns.at(i));

        if (!sResult.isEmpty()) {
            break;
        }
    }

    return sResult;
}

QDateTime XNoteRecordMapper::toDateTime(const QVariant &varValue)
{
    QDateTime dtResult;

    if (varValue.userType() == QMetaType::QDateTime) {
        dtResult = varValue.toDateTime();
    } else if (varValue.isValid() && (!varValue.isNull())) {
        bool bSuccess = false;
        double dSeconds = varValue.toDouble(&bSuccess);

        if (bSuccess) {
            dtResult = XBPList::appleTimeToDateTime(dSeconds);
        }
    }

    return dtResult;
}

bool XNoteRecordMapper::parseRect(const QVariant &varValue, XMarginNote::RECT *pRect)
{
    bool bResult = false;

    QList<double> listNumbers;

    if (varValue.userType() == QMetaType::QVariantMap) {
        QVariantMap mapRect = varValue.toMap();

        if (mapRect.contains("x") && mapRect.contains("y") && mapRect.contains("width") && mapRect.contains("height")) {
            listNumbers << mapRect.value("x").toDouble() << mapRect.value("y").toDouble() << mapRect.value("width").toDouble()
                        << mapRect.value("height").toDouble();
        }
    } else if (varValue.userType() == QMetaType::QVariantList) {
        QVariantList listValues = varValue.toList();

        for (qint32 i = 0; i < listValues.count(); i++) {
            bool bSuccess = false;
            double dValue = listValues.at(i).toDouble(&bSuccess);

            if (!bSuccess) {
                break;
            }

            listNumbers.append(dValue);
        }
    } else if (varValue.isValid()) {
        // "{{x, y}, {w, h}}"
        QString sRect = varValue.toString();
        sRect.remove('{');
        sRect.remove('}');

        QStringList listParts = sRect.split(',');

        for (qint32 i = 0; i < listParts.count(); i++) {
            bool bSuccess = false;
            double dValue = listParts.at(i).trimmed().toDouble(&bSuccess);

            if (!bSuccess) {
                break;
            }

            listNumbers.append(dValue);
        }
    }

    if (listNumbers.count() >= 4) {
        pRect->dX = listNumbers.at(0);
        pRect->dY = listNumbers.at(1);
        pRect->dWidth = listNumbers.at(2);
        pRect->dHeight = listNumbers.at(3);

        bResult = true;
    }

    return bResult;
}

QStringList XNoteRecordMapper::parseMediaList(const QString &sMediaList)
{
    QStringList listResult;

    QString sList = sMediaList.trimmed();

    if (sList.startsWith('[')) {
        QJsonDocument jsonDoc = QJsonDocument::fromJson(sList.toUtf8());
        QVariantList listValues = jsonDoc.toVariant().toList();

        for (qint32 i = 0; i < listValues.count(); i++) {
            QString sHash = listValues.at(i).toString().trimmed();

            if (!sHash.isEmpty()) {
                listResult.append(sHash);
            }
        }
    } else if (!sList.isEmpty()) {
        QStringList listParts = sList.split('-');

        for (qint32 i = 0; i < listParts.count(); i++) {
            QString sHash = listParts.at(i).trimmed();

            if (!sHash.isEmpty()) {
                listResult.append(sHash);
            }
        }
    }

    return XTextProcessor::removeDuplicates(listResult);
}

XMarginNote::TOPICTYPE XNoteRecordMapper::classifyTopic(const QVariant &varOwner, const QByteArray &baOwner)
{
    XMarginNote::TOPICTYPE result = XMarginNote::TOPICTYPE_UNKNOWN;

    if (varOwner.userType() == QMetaType::QVariantMap) {
        QVariantMap mapOwner = varOwner.toMap();

        if (mapOwner.contains("projectTopic")) {
            result = XMarginNote::TOPICTYPE_PROJECT;
        } else if (mapOwner.contains("bookTopic")) {
            result = XMarginNote::TOPICTYPE_BOOK;
        } else if (mapOwner.contains("reviewTopic")) {
            result = XMarginNote::TOPICTYPE_REVIEWTOPIC;
        } else {
            result = XMarginNote::TOPICTYPE_GENERAL;
        }
    } else if (!baOwner.isEmpty()) {
        if (baOwner.contains("projectTopic")) {
            result = XMarginNote::TOPICTYPE_PROJECT;
        } else if (baOwner.contains("bookTopic")) {
            result = XMarginNote::TOPICTYPE_BOOK;
        } else if (baOwner.contains("reviewTopic")) {
            result = XMarginNote::TOPICTYPE_REVIEWTOPIC;
        } else {
            result = XMarginNote::TOPICTYPE_GENERAL;
        }
    }

    return result;
}

QVariantList XNoteRecordMapper::_toList(const QVariant &varValue)
{
    QVariantList listResult;

    if (varValue.userType() == QMetaType::QVariantList) {
        listResult = varValue.toList();
    } else if (varValue.userType() == QMetaType::QVariantMap) {
        listResult.append(varValue);
    }

    return listResult;
}

QString XNoteRecordMapper::_toText(const QVariant &varValue)
{
    QString sResult;

    if (varValue.userType() == QMetaType::QVariantMap) {
        sResult = varValue.toMap().value("NS.string").toString();
    } else if (varValue.isValid()) {
        sResult = varValue.toString();
    }

    return sResult;
}

void XNoteRecordMapper::_applyNotesData(const QVariant &varNotesData, const XTextProcessor &textProcessor, XMarginNote::NOTERECORD *pRecord,
                                        QStringList *pListTexts)
{
    QVariantList listEntries = _toList(varNotesData);

    for (qint32 i = 0; i < listEntries.count(); i++) {
        if (listEntries.at(i).userType() == QMetaType::QString) {
            QString sText = listEntries.at(i).toString();
            QString sTrimmed = sText.trimmed();

            if (XTextProcessor::isHashtagText(sTrimmed) || sTrimmed.startsWith(textProcessor.getLinkPrefix())) {
                pListTexts->append(sTrimmed);
            } else if ((sTrimmed.length() > 1) && (!sTrimmed.startsWith("NS")) && (!sTrimmed.startsWith("$"))) {
                pListTexts->append(sText);
            }

            continue;
        }

        if (listEntries.at(i).userType() != QMetaType::QVariantMap) {
            continue;
        }

        QVariantMap mapEntry = listEntries.at(i).toMap();

        QString sNoteId = _toText(mapEntry.value("noteid")).trimmed();
        QString sType = _toText(mapEntry.value("type"));

        if (!sNoteId.isEmpty()) {
            if (sType == "LinkNote") {
                XMarginNote::LINKEDNOTE linkedNote = {};
                linkedNote.sNoteId = sNoteId;
                linkedNote.sLinkText = _toText(mapEntry.value("q_htext"));

                pRecord->listLinkedNotes.append(linkedNote);
            }

            if (!pRecord->listChildNoteIds.contains(sNoteId)) {
                pRecord->listChildNoteIds.append(sNoteId);
            }
        }

        QString sText = _toText(mapEntry.value("text"));

        if (!sText.trimmed().isEmpty()) {
            pListTexts->append(sText);
        }

        if (pRecord->sExcerptText.trimmed().isEmpty()) {
            QString sHighlightText = _toText(mapEntry.value("highlight_text"));

            if (!sHighlightText.trimmed().isEmpty()) {
                pRecord->sExcerptText = sHighlightText;
            }
        }
    }
}

void XNoteRecordMapper::_applyHighlightsData(const QVariant &varHighlightsData, XMarginNote::NOTERECORD *pRecord)
{
    QVariantList listEntries = _toList(varHighlightsData);

    for (qint32 i = 0; i < listEntries.count(); i++) {
        if (listEntries.at(i).userType() != QMetaType::QVariantMap) {
            continue;
        }

        QVariantMap mapEntry = listEntries.at(i).toMap();

        XMarginNote::HIGHLIGHT highlight;
        highlight.sText = _toText(mapEntry.value("highlight_text"));
        highlight.sCoordsHash = _toText(mapEntry.value("coords_hash"));

        QVariantList listSelections = _toList(mapEntry.value("textSelLst"));

        for (qint32 j = 0; j < listSelections.count(); j++) {
            QVariantMap mapSelection = listSelections.at(j).toMap();

            XMarginNote::TEXTSELECTION selection = {};
            selection.nPageNo = mapSelection.value("pageNo").toInt();
            selection.bHasRect = parseRect(mapSelection.value("rect"), &(selection.rect));
            selection.sText = _toText(mapSelection.value("text"));

            highlight.listSelections.append(selection);
        }

        if (!pRecord->excerptRegion.bIsValid) {
            if (!_readRegion(mapEntry, &(pRecord->excerptRegion))) {
                for (qint32 j = 0; j < highlight.listSelections.count(); j++) {
                    if (highlight.listSelections.at(j).bHasRect) {
                        pRecord->excerptRegion.bIsValid = true;
                        pRecord->excerptRegion.nPageNo = highlight.listSelections.at(j).nPageNo;
                        pRecord->excerptRegion.rect = highlight.listSelections.at(j).rect;
                        break;
                    }
                }
            }
        }

        if (pRecord->sExcerptText.trimmed().isEmpty() && (!highlight.sText.trimmed().isEmpty())) {
            pRecord->sExcerptText = highlight.sText;
        }

        pRecord->listHighlights.append(highlight);
    }
}

bool XNoteRecordMapper::_readRegion(const QVariant &varValue, XMarginNote::EXCERPTREGION *pRegion)
{
    bool bResult = false;

    if (varValue.userType() == QMetaType::QVariantMap) {
        QVariantMap mapValue = varValue.toMap();

        XMarginNote::RECT rect = {};

        if (parseRect(mapValue.value("rect"), &rect)) {
            pRegion->bIsValid = true;
            pRegion->nPageNo = mapValue.value("pageNo").toInt();
            pRegion->rect = rect;

            bResult = true;
        }
    }

    return bResult;
}
