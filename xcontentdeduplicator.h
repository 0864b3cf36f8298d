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
#ifndef XCONTENTDEDUPLICATOR_H
#define XCONTENTDEDUPLICATOR_H

#include "xmarginnote.h"

#include <QObject>

class XContentDeduplicator : public QObject {
    Q_OBJECT

public:
    struct DEDUP_STATISTICS {
        qint32 nGroupsProcessed;
        qint32 nMergedContentFound;
        qint32 nOriginalContentPreserved;
        qint32 nContentCombined;
        qint32 nGroupsDropped;
        qint32 nDuplicatesRemoved;         // Records folded into a master
        qint32 nDuplicateFeaturesRemoved;  // Tags, links, text and media
    };

    struct VALIDATION_REPORT {
        qint32 nOriginalCount;  // Members of all input groups
        qint32 nDeduplicatedCount;
        double dReductionRatio;
        qint32 nEmptyGroups;
        bool bContentPreserved;
        QStringList listIssues;
    };

    explicit XContentDeduplicator(QObject *parent = nullptr);

    QList<XMarginNote::CONTENTGROUP> deduplicate(const QList<XMarginNote::CONTENTGROUP> &listGroups, const XMarginNote::TOPICMAP &mapTopics = XMarginNote::TOPICMAP());
    bool deduplicateGroup(const XMarginNote::CONTENTGROUP &group, XMarginNote::CONTENTGROUP *pResult,
                          const XMarginNote::TOPICMAP &mapTopics = XMarginNote::TOPICMAP());
    qint32 removeDuplicateFeatures(QList<XMarginNote::CONTENTGROUP> *pListGroups);
    static qint32 removeDuplicateFeatures(XMarginNote::NOTERECORD *pRecord);

    static VALIDATION_REPORT validate(const QList<XMarginNote::CONTENTGROUP> &listOriginalGroups, const QList<XMarginNote::CONTENTGROUP> &listDeduplicatedGroups,
                                      double dThreshold = 0.9);

    static qint32 calculateScore(const XMarginNote::NOTERECORD &noteRecord);
    static qint32 selectBest(const QList<XMarginNote::NOTERECORD> &listNotes);
    static void supplement(XMarginNote::NOTERECORD *pMaster, const XMarginNote::NOTERECORD &noteRecord);

    DEDUP_STATISTICS getStatistics() const;
    void resetStatistics();

signals:
    void warningMessage(const QString &sText);

private:
    // Members and type follow the input group, the type is looked up again for a new master
    static XMarginNote::CONTENTGROUP _createGroup(const XMarginNote::CONTENTGROUP &group, const XMarginNote::NOTERECORD &masterNote,
                                                  const XMarginNote::TOPICMAP &mapTopics);
    static QString _getHighlightKey(const XMarginNote::HIGHLIGHT &highlight);

private:
    DEDUP_STATISTICS g_statistics;
};

#endif  // XCONTENTDEDUPLICATOR_H
