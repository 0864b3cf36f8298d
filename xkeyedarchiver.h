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
#ifndef XKEYEDARCHIVER_H
#define XKEYEDARCHIVER_H

#include "xbplist.h"

#include <QHash>
#include <QObject>
#include <QVariant>

class XKeyedArchiver : public QObject {
    Q_OBJECT

public:
    enum DECODE_RESULT {
        DECODE_RESULT_OK = 0,
        DECODE_RESULT_EMPTY,          // Empty input
        DECODE_RESULT_DEGRADED,       // Scanned strings and integers only
        DECODE_RESULT_NOTARCHIVE,     // Valid plist without the archiver keys
        DECODE_RESULT_PLISTERROR,     // Malformed binary property list
        DECODE_RESULT_CYCLE           // Strict mode only
    };

    struct OPTIONS {
        bool bStrict;
        qint32 nMaxDepth;

        OPTIONS()
        {
            bStrict = false;
            nMaxDepth = 512;
        }
    };

    explicit XKeyedArchiver(QObject *parent = nullptr);

    void setOptions(const OPTIONS &options);
    OPTIONS getOptions() const;

    static bool isKeyedArchive(const XBPList &plist);

    DECODE_RESULT decode(const QByteArray &baData, QVariant *pvarResult);
    QVariant resolve(const XBPList &plist);
    static QVariant simplify(const QString &sClassName, const QVariantMap &mapFields);

    qint32 getCycleCount() const;
    QString getErrorString() const;

signals:
    void errorMessage(const QString &sText);
    void warningMessage(const QString &sText);

private:
    static qint32 _findDictValue(const XBPList &plist, qint32 nDictIndex, const QString &sKey);
    QString _readClassName(const XBPList &plist, qint32 nIndex) const;
    QVariant _resolveUID(const XBPList &plist, qint32 nUID, qint32 nDepth);
    QVariant _resolveObject(const XBPList &plist, qint32 nIndex, qint32 nDepth);

private:
    OPTIONS g_options;
    QList<qint32> g_listArchiveObjects;  // $objects: archive UID -> plist object index
    QList<qint32> g_listStack;
    QHash<qint32, QVariant> g_hashResolved;
    qint32 g_nCycleCount;
    QString g_sErrorString;
};

#endif  // XKEYEDARCHIVER_H
