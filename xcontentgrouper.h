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
#ifndef XCONTENTGROUPER_H
#define XCONTENTGROUPER_H

#include "xmarginnote.h"
#include "xunionfind.h"

#include <QObject>

class XContentGrouper : public QObject {
    Q_OBJECT

public:
    struct STATISTICS {
        qint32 nNumberOfNotes;
        qint32 nNumberOfGroups;
        qint32 nSingleGroups;
        qint32 nGroupedNotes;  // Members of groups with more than one note
        qint32 nLargestGroup;
        qint32 nNumberOfRelations;
    };

    explicit XContentGrouper(QObject *parent = nullptr);

    QList<XMarginNote::CONTENTGROUP> createGroups(const QList<XMarginNote::NOTERECORD> &listNotes, const XMarginNote::TOPICMAP &mapTopics);
    STATISTICS getStatistics() const;

    static XMarginNote::TOPICTYPE getTopicType(const XMarginNote::NOTERECORD &noteRecord, const XMarginNote::TOPICMAP &mapTopics);
    static qint32 selectMaster(const QList<XMarginNote::NOTERECORD> &listNotes, const XMarginNote::TOPICMAP &mapTopics);

private:
    STATISTICS g_statistics;
};

#endif  // XCONTENTGROUPER_H
