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
#include <gtest/gtest.h>

#include "xcontentgrouper.h"

static XMarginNote::NOTERECORD _createNote(const QString &sNoteId, const QString &sTopicId = "", const QString &sGroupNoteId = "", const QString &sExternalId = "")
{
    XMarginNote::NOTERECORD result = XMarginNote::NOTERECORD();

    result.sNoteId = sNoteId;
    result.sTopicId = sTopicId;
    result.sGroupNoteId = sGroupNoteId;
    result.sExternalId = sExternalId;
    result.sExcerptText = QString("text of %1").arg(sNoteId);

    return result;
}

static XMarginNote::TOPICMAP _createTopics()
{
    XMarginNote::TOPICMAP mapResult;

    XMarginNote::TOPICRECORD project = XMarginNote::TOPICRECORD();
    project.sTopicId = "TP";
    project.topicType = XMarginNote::TOPICTYPE_PROJECT;

    XMarginNote::TOPICRECORD book = XMarginNote::TOPICRECORD();
    book.sTopicId = "TB";
    book.topicType = XMarginNote::TOPICTYPE_BOOK;

    XMarginNote::TOPICRECORD review = XMarginNote::TOPICRECORD();
    review.sTopicId = "TR";
    review.topicType = XMarginNote::TOPICTYPE_REVIEWTOPIC;

    mapResult.insert(project.sTopicId, project);
    mapResult.insert(book.sTopicId, book);
    mapResult.insert(review.sTopicId, review);

    return mapResult;
}

TEST(XContentGrouperTest, UnrelatedNotesStaySingle)
{
    QList<XMarginNote::NOTERECORD> listNotes;
    listNotes << _createNote("N1") << _createNote("N2");

    XContentGrouper grouper;
    QList<XMarginNote::CONTENTGROUP> listGroups = grouper.createGroups(listNotes, XMarginNote::TOPICMAP());

    ASSERT_EQ(2, listGroups.count());
    EXPECT_EQ(QString("N1"), listGroups.at(0).sMasterNoteId);
    EXPECT_EQ(QString("N2"), listGroups.at(1).sMasterNoteId);
    EXPECT_EQ(2, grouper.getStatistics().nSingleGroups);
    EXPECT_EQ(0, grouper.getStatistics().nGroupedNotes);
}

TEST(XContentGrouperTest, GroupAndExternalIdsChainNotes)
{
    QList<XMarginNote::NOTERECORD> listNotes;
    listNotes << _createNote("A", "", "B") << _createNote("B", "", "", "C") << _createNote("C");

    XContentGrouper grouper;
    QList<XMarginNote::CONTENTGROUP> listGroups = grouper.createGroups(listNotes, XMarginNote::TOPICMAP());

    ASSERT_EQ(1, listGroups.count());
    EXPECT_EQ(QStringList() << "A"
                            << "B"
                            << "C",
              listGroups.at(0).listNoteIds);
    EXPECT_EQ(3, listGroups.at(0).listNotes.count());

    XContentGrouper::STATISTICS statistics = grouper.getStatistics();

    EXPECT_EQ(3, statistics.nNumberOfNotes);
    EXPECT_EQ(1, statistics.nNumberOfGroups);
    EXPECT_EQ(3, statistics.nGroupedNotes);
    EXPECT_EQ(3, statistics.nLargestGroup);
    EXPECT_EQ(2, statistics.nNumberOfRelations);
}

TEST(XContentGrouperTest, IdsThatNameNoNoteAreNotMembers)
{
    QList<XMarginNote::NOTERECORD> listNotes;
    listNotes << _createNote("N1", "", "", "EVERNOTE") << _createNote("N2", "", "", "EVERNOTE");

    XContentGrouper grouper;
    QList<XMarginNote::CONTENTGROUP> listGroups = grouper.createGroups(listNotes, XMarginNote::TOPICMAP());

    ASSERT_EQ(1, listGroups.count());
    EXPECT_EQ(QStringList() << "N1"
                            << "N2",
              listGroups.at(0).listNoteIds);
}

TEST(XContentGrouperTest, LinksToKnownNotesGroup)
{
    XMarginNote::NOTERECORD note1 = _createNote("N1");
    note1.listLinks << "N3"
                    << "MISSING";

    QList<XMarginNote::NOTERECORD> listNotes;
    listNotes << note1 << _createNote("N2") << _createNote("N3");

    XContentGrouper grouper;
    QList<XMarginNote::CONTENTGROUP> listGroups = grouper.createGroups(listNotes, XMarginNote::TOPICMAP());

    ASSERT_EQ(2, listGroups.count());
    EXPECT_EQ(QStringList() << "N1"
                            << "N3",
              listGroups.at(0).listNoteIds);
    EXPECT_EQ(1, grouper.getStatistics().nNumberOfRelations);
}

TEST(XContentGrouperTest, ProjectBeatsBook)
{
    QList<XMarginNote::NOTERECORD> listNotes;
    listNotes << _createNote("BOOK", "TB") << _createNote("PROJECT", "TP", "BOOK") << _createNote("REVIEW", "TR", "BOOK");

    XContentGrouper grouper;
    QList<XMarginNote::CONTENTGROUP> listGroups = grouper.createGroups(listNotes, _createTopics());

    ASSERT_EQ(1, listGroups.count());
    EXPECT_EQ(QString("PROJECT"), listGroups.at(0).sMasterNoteId);
    EXPECT_EQ(QString("PROJECT"), listGroups.at(0).masterNote.sNoteId);
    EXPECT_EQ(XMarginNote::TOPICTYPE_PROJECT, listGroups.at(0).groupType);
}

TEST(XContentGrouperTest, OriginalPreferredWithinTier)
{
    QList<XMarginNote::NOTERECORD> listNotes;
    listNotes << _createNote("MERGED", "TB", "ORIGINAL") << _createNote("ORIGINAL", "TB");

    EXPECT_EQ(1, XContentGrouper::selectMaster(listNotes, _createTopics()));

    listNotes[1].sGroupNoteId = "MERGED";

    EXPECT_EQ(0, XContentGrouper::selectMaster(listNotes, _createTopics()));
    EXPECT_EQ(-1, XContentGrouper::selectMaster(QList<XMarginNote::NOTERECORD>(), _createTopics()));
}

TEST(XContentGrouperTest, UnknownTopicFallsToLastTier)
{
    QList<XMarginNote::NOTERECORD> listNotes;
    listNotes << _createNote("N1", "UNLISTED") << _createNote("N2", "TR", "N1");

    XContentGrouper grouper;
    QList<XMarginNote::CONTENTGROUP> listGroups = grouper.createGroups(listNotes, _createTopics());

    ASSERT_EQ(1, listGroups.count());
    EXPECT_EQ(QString("N2"), listGroups.at(0).sMasterNoteId);
    EXPECT_EQ(XMarginNote::TOPICTYPE_REVIEWTOPIC, listGroups.at(0).groupType);
    EXPECT_EQ(XMarginNote::TOPICTYPE_UNKNOWN, XContentGrouper::getTopicType(listNotes.at(0), _createTopics()));
}
