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
#include "xunionfind.h"

XUnionFind::XUnionFind()
{
}

qint32 XUnionFind::add(const QString &sId)
{
    qint32 nResult = g_hashIndexes.value(sId, -1);

    if (nResult == -1) {
        nResult = g_listIds.count();

        g_hashIndexes.insert(sId, nResult);
        g_listIds.append(sId);
        g_listParents.append(nResult);
        g_listRanks.append(0);
    }

    return nResult;
}

bool XUnionFind::contains(const QString &sId) const
{
    return g_hashIndexes.contains(sId);
}

qint32 XUnionFind::getIndex(const QString &sId) const
{
    return g_hashIndexes.value(sId, -1);
}

QString XUnionFind::getId(qint32 nIndex) const
{
    return g_listIds.value(nIndex);
}

qint32 XUnionFind::getCount() const
{
    return g_listIds.count();
}

qint32 XUnionFind::find(qint32 nIndex)
{
    qint32 nResult = -1;

    if ((nIndex >= 0) && (nIndex < g_listParents.count())) {
        nResult = nIndex;

        while (g_listParents.at(nResult) != nResult) {
            nResult = g_listParents.at(nResult);
        }

        // Path compression
        qint32 nCurrent = nIndex;

        while (g_listParents.at(nCurrent) != nResult) {
            qint32 nNext = g_listParents.at(nCurrent);
            g_listParents[nCurrent] = nResult;
            nCurrent = nNext;
        }
    }

    return nResult;
}

QString XUnionFind::find(const QString &sId)
{
    return g_listIds.at(find(add(sId)));
}

bool XUnionFind::unite(const QString &sId1, const QString &sId2)
{
    bool bResult = false;

    qint32 nRoot1 = find(add(sId1));
    qint32 nRoot2 = find(add(sId2));

    if (nRoot1 != nRoot2) {
        qint32 nRank1 = g_listRanks.at(nRoot1);
        qint32 nRank2 = g_listRanks.at(nRoot2);

        if (nRank1 < nRank2) {
            g_listParents[nRoot1] = nRoot2;
        } else if (nRank1 > nRank2) {
            g_listParents[nRoot2] = nRoot1;
        } else {
            g_listParents[nRoot2] = nRoot1;
            g_listRanks[nRoot1] = nRank1 + 1;
        }

        bResult = true;
    }

    return bResult;
}

bool XUnionFind::isConnected(const QString &sId1, const QString &sId2)
{
    bool bResult = false;

    if (contains(sId1) && contains(sId2)) {
        bResult = (find(getIndex(sId1)) == find(getIndex(sId2)));
    }

    return bResult;
}

QList<QStringList> XUnionFind::getGroups()
{
    QList<QStringList> listResult;
    QHash<qint32, qint32> hashGroupByRoot;

    qint32 nNumberOfIds = g_listIds.count();

    // Groups and members keep insertion order
    for (qint32 i = 0; i < nNumberOfIds; i++) {
        qint32 nRoot = find(i);
        qint32 nGroup = hashGroupByRoot.value(nRoot, -1);

        if (nGroup == -1) {
            nGroup = listResult.count();
            hashGroupByRoot.insert(nRoot, nGroup);
            listResult.append(QStringList());
        }

        listResult[nGroup].append(g_listIds.at(i));
    }

    return listResult;
}

void XUnionFind::clear()
{
    g_hashIndexes.clear();
    g_listIds.clear();
    g_listParents.clear();
    g_listRanks.clear();
}
