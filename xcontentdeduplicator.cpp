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
#include "xcontentdeduplicator.h"

#include "xcontentgrouper.h"
#include "xtextprocessor.h"

#include <QSet>

XContentDeduplicator::XContentDeduplicator(QObject *parent) : QObject(parent)
{
    g_statistics = {};
}

QList<XMarginNote::CONTENTGROUP> XContentDeduplicator::deduplicate(const QList<XMarginNote::CONTENTGROUP> &listGroups, const XMarginNote::TOPICMAP &mapTopics)
{
    QList<XMarginNote::CONTENTGROUP> listResult;

    qint32 nNumberOfGroups = listGroups.count();

    for (qint32 i = 0; i < nNumberOfGroups; i++) {
        XMarginNote::CONTENTGROUP group;

        if (deduplicateGroup(listGroups.at(i), &group, mapTopics)) {
            listResult.append(group);
        } else {
            g_statistics.nGroupsDropped++;

            emit warningMessage(tr("Group without notes dropped"));
        }

        g_statistics.nGroupsProcessed++;
    }

    removeDuplicateFeatures(&listResult);

#ifdef QT_DEBUG
    qDebug("Deduplicated %d groups into %d", nNumberOfGroups, listResult.count());
#endif

    return listResult;
}

bool XContentDeduplicator::deduplicateGroup(const XMarginNote::CONTENTGROUP &group, XMarginNote::CONTENTGROUP *pResult, const XMarginNote::TOPICMAP &mapTopics)
{
    bool bResult = false;

    QList<XMarginNote::NOTERECORD> listMerged;
    QList<XMarginNote::NOTERECORD> listOriginal;

    qint32 nNumberOfNotes = group.listNotes.count();

    for (qint32 i = 0; i < nNumberOfNotes; i++) {
        if (XMarginNote::isMerged(group.listNotes.at(i))) {
            listMerged.append(group.listNotes.at(i));
        } else {
            listOriginal.append(group.listNotes.at(i));
        }
    }

    if ((!listMerged.isEmpty()) && (!listOriginal.isEmpty())) {
        // Merged records keep the edits, originals fill the gaps
        XMarginNote::NOTERECORD masterNote = listMerged.at(selectBest(listMerged));

        for (qint32 i = 0; i < listOriginal.count(); i++) {
            supplement(&masterNote, listOriginal.at(i));
        }

        *pResult = _createGroup(group, masterNote, mapTopics);

        g_statistics.nMergedContentFound++;
        g_statistics.nContentCombined++;
        bResult = true;
    } else if (!listMerged.isEmpty()) {
        *pResult = _createGroup(group, listMerged.at(selectBest(listMerged)), mapTopics);

        bResult = true;
    } else if (!listOriginal.isEmpty()) {
        XMarginNote::NOTERECORD masterNote = listOriginal.at(0);

        for (qint32 i = 1; i < listOriginal.count(); i++) {
            supplement(&masterNote, listOriginal.at(i));
        }

        *pResult = _createGroup(group, masterNote, mapTopics);

        g_statistics.nOriginalContentPreserved++;
        bResult = true;
    }

    if (bResult) {
        g_statistics.nDuplicatesRemoved += (nNumberOfNotes - 1);
    }

    return bResult;
}

qint32 XContentDeduplicator::removeDuplicateFeatures(QList<XMarginNote::CONTENTGROUP> *pListGroups)
{
    qint32 nResult = 0;

    qint32 nNumberOfGroups = pListGroups->count();

    for (qint32 i = 0; i < nNumberOfGroups; i++) {
        nResult += removeDuplicateFeatures(&((*pListGroups)[i].masterNote));
    }

    g_statistics.nDuplicateFeaturesRemoved += nResult;

    return nResult;
}

qint32 XContentDeduplicator::removeDuplicateFeatures(XMarginNote::NOTERECORD *pRecord)
{
    qint32 nResult = 0;

    QStringList listHashtags;
    QSet<QString> stHashtags;

    for (qint32 i = 0; i < pRecord->listHashtags.count(); i++) {
        const QString &sTag = pRecord->listHashtags.at(i);

        if (!stHashtags.contains(sTag)) {
            stHashtags.insert(sTag);
            listHashtags.append(sTag);
        }
    }

    QStringList listLinks;
    QSet<QString> stLinks;

    for (qint32 i = 0; i < pRecord->listLinks.count(); i++) {
        const QString &sLink = pRecord->listLinks.at(i);

        if (!stLinks.contains(sLink)) {
            stLinks.insert(sLink);
            listLinks.append(sLink);
        }
    }

    QStringList listOtherText;
    QSet<QString> stOtherText;

    for (qint32 i = 0; i < pRecord->listOtherText.count(); i++) {
        QString sText = pRecord->listOtherText.at(i).trimmed();

        if ((!sText.isEmpty()) && (!stOtherText.contains(sText))) {
            stOtherText.insert(sText);
            listOtherText.append(pRecord->listOtherText.at(i));
        }
    }

    QList<XMarginNote::MEDIAATTACHMENT> listMedia;
    QSet<QString> stMedia;

    for (qint32 i = 0; i < pRecord->listMedia.count(); i++) {
        const XMarginNote::MEDIAATTACHMENT &attachment = pRecord->listMedia.at(i);

        if (!stMedia.contains(attachment.sMediaHash)) {
            stMedia.insert(attachment.sMediaHash);
            listMedia.append(attachment);
        }
    }

    nResult += (pRecord->listHashtags.count() - listHashtags.count());
    nResult += (pRecord->listLinks.count() - listLinks.count());
    nResult += (pRecord->listOtherText.count() - listOtherText.count());
    nResult += (pRecord->listMedia.count() - listMedia.count());

    bool bOtherTextChanged = (pRecord->listOtherText.count() != listOtherText.count());

    pRecord->listHashtags = listHashtags;
    pRecord->listLinks = listLinks;
    pRecord->listOtherText = listOtherText;
    pRecord->listMedia = listMedia;

    if (bOtherTextChanged) {
        pRecord->sFormattedText = XTextProcessor::formatText(pRecord->listOtherText, &(pRecord->textFormat));
    }

    return nResult;
}

XContentDeduplicator::VALIDATION_REPORT XContentDeduplicator::validate(const QList<XMarginNote::CONTENTGROUP> &listOriginalGroups,
                                                                       const QList<XMarginNote::CONTENTGROUP> &listDeduplicatedGroups, double dThreshold)
{
    VALIDATION_REPORT result = {};

    result.bContentPreserved = true;

    for (qint32 i = 0; i < listOriginalGroups.count(); i++) {
        result.nOriginalCount += listOriginalGroups.at(i).listNotes.count();
    }

    result.nDeduplicatedCount = listDeduplicatedGroups.count();

    if (result.nOriginalCount > 0) {
        result.dReductionRatio = (double)(result.nOriginalCount - result.nDeduplicatedCount) / result.nOriginalCount;
    }

    if (result.dReductionRatio > dThreshold) {
        result.listIssues.append(QString("High reduction ratio: %1%").arg(result.dReductionRatio * 100, 0, 'f', 1));
        result.bContentPreserved = false;
    }

    for (qint32 i = 0; i < listDeduplicatedGroups.count(); i++) {
        if (!XMarginNote::hasContent(listDeduplicatedGroups.at(i).masterNote)) {
            result.nEmptyGroups++;
        }
    }

    if (result.nEmptyGroups > 0) {
        result.listIssues.append(QString("%1 groups have no content").arg(result.nEmptyGroups));
        result.bContentPreserved = false;
    }

    return result;
}

qint32 XContentDeduplicator::calculateScore(const XMarginNote::NOTERECORD &noteRecord)
{
    qint32 nResult = 0;

    nResult += noteRecord.sExcerptText.trimmed().length();
    nResult += noteRecord.sNotesText.trimmed().length() * 2;
    nResult += noteRecord.sNoteTitle.trimmed().length() * 3;
    nResult += noteRecord.listHashtags.count() * 10;
    nResult += noteRecord.listLinks.count() * 5;
    nResult += noteRecord.listOtherText.count() * 2;
    nResult += noteRecord.listMedia.count() * 15;

    if (noteRecord.excerptRegion.bIsValid) {
        nResult += 20;
    }

    return nResult;
}

qint32 XContentDeduplicator::selectBest(const QList<XMarginNote::NOTERECORD> &listNotes)
{
    qint32 nResult = -1;
    qint32 nBestScore = -1;

    qint32 nNumberOfNotes = listNotes.count();

    // Ties go to the earlier record
    for (qint32 i = 0; i < nNumberOfNotes; i++) {
        qint32 nScore = calculateScore(listNotes.at(i));

        if (nScore > nBestScore) {
            nBestScore = nScore;
            nResult = i;
        }
    }

    return nResult;
}

void XContentDeduplicator::supplement(XMarginNote::NOTERECORD *pMaster, const XMarginNote::NOTERECORD &noteRecord)
{
    if (pMaster->sExcerptText.isEmpty()) {
        pMaster->sExcerptText = noteRecord.sExcerptText;
    }

    if (pMaster->sNotesText.isEmpty()) {
        pMaster->sNotesText = noteRecord.sNotesText;
    }

    if (pMaster->sNoteTitle.isEmpty()) {
        pMaster->sNoteTitle = noteRecord.sNoteTitle;
    }

    if ((!pMaster->excerptRegion.bIsValid) && noteRecord.excerptRegion.bIsValid) {
        pMaster->excerptRegion = noteRecord.excerptRegion;
    }

    for (qint32 i = 0; i < noteRecord.listHashtags.count(); i++) {
        if (!pMaster->listHashtags.contains(noteRecord.listHashtags.at(i))) {
            pMaster->listHashtags.append(noteRecord.listHashtags.at(i));
        }
    }

    for (qint32 i = 0; i < noteRecord.listLinks.count(); i++) {
        if (!pMaster->listLinks.contains(noteRecord.listLinks.at(i))) {
            pMaster->listLinks.append(noteRecord.listLinks.at(i));
        }
    }

    for (qint32 i = 0; i < noteRecord.listOtherText.count(); i++) {
        if (!pMaster->listOtherText.contains(noteRecord.listOtherText.at(i))) {
            pMaster->listOtherText.append(noteRecord.listOtherText.at(i));
        }
    }

    QSet<QString> stMedia;

    for (qint32 i = 0; i < pMaster->listMedia.count(); i++) {
        stMedia.insert(pMaster->listMedia.at(i).sMediaHash);
    }

    for (qint32 i = 0; i < noteRecord.listMedia.count(); i++) {
        if (!stMedia.contains(noteRecord.listMedia.at(i).sMediaHash)) {
            stMedia.insert(noteRecord.listMedia.at(i).sMediaHash);
            pMaster->listMedia.append(noteRecord.listMedia.at(i));
        }
    }

    // Highlights without a coordinates hash are matched by text
    QSet<QString> stHighlights;

    for (qint32 i = 0; i < pMaster->listHighlights.count(); i++) {
        stHighlights.insert(_getHighlightKey(pMaster->listHighlights.at(i)));
    }

    for (qint32 i = 0; i < noteRecord.listHighlights.count(); i++) {
        QString sKey = _getHighlightKey(noteRecord.listHighlights.at(i));

        if (!stHighlights.contains(sKey)) {
            stHighlights.insert(sKey);
            pMaster->listHighlights.append(noteRecord.listHighlights.at(i));
        }
    }

    for (qint32 i = 0; i < noteRecord.listLinkedNotes.count(); i++) {
        bool bFound = false;

        for (qint32 j = 0; j < pMaster->listLinkedNotes.count(); j++) {
            if (pMaster->listLinkedNotes.at(j).sNoteId == noteRecord.listLinkedNotes.at(i).sNoteId) {
                bFound = true;
                break;
            }
        }

        if (!bFound) {
            pMaster->listLinkedNotes.append(noteRecord.listLinkedNotes.at(i));
        }
    }

    for (qint32 i = 0; i < noteRecord.listChildNoteIds.count(); i++) {
        if (!pMaster->listChildNoteIds.contains(noteRecord.listChildNoteIds.at(i))) {
            pMaster->listChildNoteIds.append(noteRecord.listChildNoteIds.at(i));
        }
    }

    // Derived from the text gathered above
    QString sAllText = XMarginNote::getAllText(*pMaster);

    pMaster->sFormattedText = XTextProcessor::formatText(pMaster->listOtherText, &(pMaster->textFormat));
    pMaster->nWordCount = XTextProcessor::countWords(sAllText);
    pMaster->sLanguage = XTextProcessor::detectLanguage(sAllText);
}

XContentDeduplicator::DEDUP_STATISTICS XContentDeduplicator::getStatistics() const
{
    return g_statistics;
}

void XContentDeduplicator::resetStatistics()
{
    g_statistics = {};
}

XMarginNote::CONTENTGROUP XContentDeduplicator::_createGroup(const XMarginNote::CONTENTGROUP &group, const XMarginNote::NOTERECORD &masterNote,
                                                             const XMarginNote::TOPICMAP &mapTopics)
{
    XMarginNote::CONTENTGROUP result;

    result.sMasterNoteId = masterNote.sNoteId;
    result.listNoteIds = group.listNoteIds;
    result.listNotes = group.listNotes;
    result.masterNote = masterNote;
    result.groupType = group.groupType;

    if (masterNote.sNoteId != group.sMasterNoteId) {
        result.groupType = XContentGrouper::getTopicType(masterNote, mapTopics);
    }

    return result;
}

QString XContentDeduplicator::_getHighlightKey(const XMarginNote::HIGHLIGHT &highlight)
{
    QString sResult;

    if (!highlight.sCoordsHash.isEmpty()) {
        sResult = "hash:" + highlight.sCoordsHash;
    } else {
        sResult = "text:" + highlight.sText.trimmed();
    }

    return sResult;
}
