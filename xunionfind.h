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
#ifndef XUNIONFIND_H
#define XUNIONFIND_H

#include <QHash>
#include <QList>
#include <QString>
#include <QStringList>

class XUnionFind {
public:
    XUnionFind();

    qint32 add(const QString &sId);
    bool contains(const QString &sId) const;
    qint32 getIndex(const QString &sId) const;
    QString getId(qint32 nIndex) const;
    qint32 getCount() const;

    qint32 find(qint32 nIndex);
    QString find(const QString &sId);
    bool unite(const QString &sId1, const QString &sId2);
    bool isConnected(const QString &sId1, const QString &sId2);

    QList<QStringList> getGroups();
    void clear();

private:
    QHash<QString, qint32> g_hashIndexes;
    QStringList g_listIds;
    QList<qint32> g_listParents;
    QList<qint32> g_listRanks;
};

#endif  // XUNIONFIND_H
