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
#include "xcontentgrouper.h"

#include <QDebug>

XContentGrouper::XContentGrouper(QObject *parent) : QObject(parent)
{
    g_statistics = {};
}

QList<XMarginNote::CONTENTGROUP> XContentGrouper::createGroups(const QList<XMarginNote::NOTERECORD> &listNotes, const XMarginNote::TOPICMAP &mapTopics)
{
    QList<XMarginNote::CONTENTGROUP> listResult;

    g_statistics = {};
    g_statistics.nNumberOfNotes = listNotes.count();

    XUnionFind unionFind;
    QHash<QString, qint32> hashNotes;

    qint32 nNumberOfNotes = listNotes.count();

    // Notes first, so that groups follow the record order
    for (qint32 i = 0; i < nNumberOfNotes; i++) {
        unionFind.add(listNotes.at(i).sNoteId);
        hashNotes.insert(listNotes.at(i).sNoteId, i);
    }

    for (qint32 i = 0; i < nNumberOfNotes; i++) {
        const XMarginNote::NOTERECORD &noteRecord = listNotes.at(i);

        if (!noteRecord.sGroupNoteId.isEmpty()) {
            unionFind.unite(noteRecord.sNoteId, noteRecord.sGroupNoteId);
            g_statistics.nNumberOfRelations++;
        }

        if (!noteRecord.sExternalId.isEmpty()) {
            unionFind.unite(noteRecord.sNoteId, noteRecord.sExternalId);
            g_statistics.nNumberOfRelations++;
        }

        qint32 nNumberOfLinks = noteRecord.listLinks.count();

        for (qint32 j = 0; j < nNumberOfLinks; j++) {
            if (hashNotes.contains(noteRecord.listLinks.at(j))) {
                unionFind.unite(noteRecord.sNoteId, noteRecord.listLinks.at(j));
                g_statistics.nNumberOfRelations++;
            }
        }
    }

    QList<QStringList> listPartitions = unionFind.getGroups();

    qint32 nNumberOfPartitions = listPartitions.count();

    for (qint32 i = 0; i < nNumberOfPartitions; i++) {
        XMarginNote::CONTENTGROUP group;
        group.groupType = XMarginNote::TOPICTYPE_UNKNOWN;

        const QStringList &listIds = listPartitions.at(i);

        for (qint32 j = 0; j < listIds.count(); j++) {
            // Group and external ids that name no note
            if (hashNotes.contains(listIds.at(j))) {
                group.listNoteIds.append(listIds.at(j));
                group.listNotes.append(listNotes.at(hashNotes.value(listIds.at(j))));
            }
        }

        if (group.listNotes.isEmpty()) {
            continue;
        }

        qint32 nMaster = selectMaster(group.listNotes, mapTopics);

        if ((nMaster < 0) || (nMaster >= group.listNotes.count())) {
            qWarning("Master is not a member of its group");
            nMaster = 0;
        }

        group.masterNote = group.listNotes.at(nMaster);
        group.sMasterNoteId = group.masterNote.sNoteId;
        group.groupType = getTopicType(group.masterNote, mapTopics);

        if (group.listNotes.count() == 1) {
            g_statistics.nSingleGroups++;
        } else {
            g_statistics.nGroupedNotes += group.listNotes.count();
        }

        g_statistics.nLargestGroup = qMax(g_statistics.nLargestGroup, (qint32)group.listNotes.count());

        listResult.append(group);
    }

    g_statistics.nNumberOfGroups = listResult.count();

#ifdef QT_DEBUG
    qDebug("Groups: %d, grouped notes: %d, relations: %d", g_statistics.nNumberOfGroups, g_statistics.nGroupedNotes, g_statistics.nNumberOfRelations);
#endif

    return listResult;
}

XContentGrouper::STATISTICS XContentGrouper::getStatistics() const
{
    return g_statistics;
}

XMarginNote::TOPICTYPE XContentGrouper::getTopicType(const XMarginNote::NOTERECORD &noteRecord, const XMarginNote::TOPICMAP &mapTopics)
{
    XMarginNote::TOPICTYPE result = XMarginNote::TOPICTYPE_UNKNOWN;

    if (!noteRecord.sTopicId.isEmpty()) {
        XMarginNote::TOPICMAP::const_iterator iter = mapTopics.constFind(noteRecord.sTopicId);

        if (iter != mapTopics.constEnd()) {
            result = iter.value().topicType;
        }
    }

    return result;
}

qint32 XContentGrouper::selectMaster(const QList<XMarginNote::NOTERECORD> &listNotes, const XMarginNote::TOPICMAP &mapTopics)
{
    qint32 nResult = -1;

    if (!listNotes.isEmpty()) {
        nResult = 0;

        // Project > Book > ReviewTopic > everything else
        QList<qint32> listTiers[4];

        qint32 nNumberOfNotes = listNotes.count();

        for (qint32 i = 0; i < nNumberOfNotes; i++) {
            XMarginNote::TOPICTYPE topicType = getTopicType(listNotes.at(i), mapTopics);

            switch (topicType) {
                case XMarginNote::TOPICTYPE_PROJECT: listTiers[0].append(i); break;
                case XMarginNote::TOPICTYPE_BOOK: listTiers[1].append(i); break;
                case XMarginNote::TOPICTYPE_REVIEWTOPIC: listTiers[2].append(i); break;
                default: listTiers[3].append(i); break;
            }
        }

        for (qint32 i = 0; i < 4; i++) {
            if (!listTiers[i].isEmpty()) {
                nResult = listTiers[i].first();

                for (qint32 j = 0; j < listTiers[i].count(); j++) {
                    if (XMarginNote::isOriginal(listNotes.at(listTiers[i].at(j)))) {
                        nResult = listTiers[i].at(j);
                        break;
                    }
                }

                break;
            }
        }
    }

    return nResult;
}
