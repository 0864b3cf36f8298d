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
#ifndef XBPLIST_H
#define XBPLIST_H

#include "xdatareader.h"

#include <QDateTime>
#include <QList>
#include <QObject>
#include <QSet>
#include <QVariant>

class XBPList : public QObject {
    Q_OBJECT

public:
    enum VT {
        VT_NULL = 0,
        VT_BOOL,
        VT_INTEGER,
        VT_REAL,
        VT_DATE,
        VT_DATA,
        VT_STRING,
        VT_UID,
        VT_ARRAY,
        VT_SET,
        VT_DICT
    };

    enum MARKER {
        MARKER_NULL = 0x00,
        MARKER_FALSE = 0x08,
        MARKER_TRUE = 0x09,
        MARKER_FILL = 0x0F,
        MARKER_INT = 0x10,
        MARKER_REAL = 0x20,
        MARKER_DATE = 0x33,
        MARKER_DATA = 0x40,
        MARKER_ASCIISTRING = 0x50,
        MARKER_UNICODE16STRING = 0x60,
        MARKER_UTF8STRING = 0x70,
        MARKER_UID = 0x80,
        MARKER_ARRAY = 0xA0,
        MARKER_SET = 0xC0,
        MARKER_DICT = 0xD0
    };

    struct TRAILER {
        quint8 nOffsetIntSize;
        quint8 nObjectRefSize;
        quint64 nNumberOfObjects;
        quint64 nTopObject;
        quint64 nOffsetTableOffset;
    };

    struct OBJECT {
        VT vt;
        QVariant varValue;            // Scalars; UID index for VT_UID
        QList<qint32> listIndexes;    // Array/set elements, dictionary values
        QList<qint32> listKeyIndexes;  // Dictionary keys
    };

    static const qint32 HEADER_SIZE = 8;
    static const qint32 TRAILER_SIZE = 32;
    // Seconds between 1970-01-01 and 2001-01-01
    static const qint64 APPLE_EPOCH_OFFSET = 978307200;

    explicit XBPList(QObject *parent = nullptr);

    static bool isValid(const QByteArray &baData);
    static QDateTime appleTimeToDateTime(double dSeconds);

    bool parse(const QByteArray &baData);
    bool isDegraded() const;
    const QList<OBJECT> &getObjects() const;
    qint32 getTopIndex() const;
    QString getErrorString() const;

    // Generic value tree, UIDs become {"CF$UID": n}
    QVariant toVariant() const;
    QVariant toVariant(qint32 nIndex) const;

signals:
    void errorMessage(const QString &sText);
    void warningMessage(const QString &sText);

private:
    bool _readTrailer(const XDataReader &reader, TRAILER *pTrailer);
    bool _parseObjectTable(const XDataReader &reader, const TRAILER &trailer);
    bool _readObject(const XDataReader &reader, qint64 nOffset, qint64 nLimit, quint8 nObjectRefSize, qint64 nNumberOfObjects, OBJECT *pObject);
    bool _readLength(const XDataReader &reader, qint64 nOffset, quint8 nMarker, qint64 *pnLength, qint64 *pnDataOffset);
    bool _parseDegraded(const XDataReader &reader);
    QVariant _toVariant(qint32 nIndex, QSet<qint32> *pStack) const;
    void _error(const QString &sText);

private:
    QList<OBJECT> g_listObjects;
    qint32 g_nTopIndex;
    bool g_bDegraded;
    QString g_sErrorString;
};

#endif  // XBPLIST_H
