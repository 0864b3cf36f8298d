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
#include "xbplist.h"

#include <QDebug>

#include <cmath>

XBPList::XBPList(QObject *parent) : QObject(parent)
{
    g_nTopIndex = -1;
    g_bDegraded = false;
}

bool XBPList::isValid(const QByteArray &baData)
{
    return baData.startsWith("bplist0");
}

QDateTime XBPList::appleTimeToDateTime(double dSeconds)
{
    QDateTime dtResult;

    if (!std::isnan(dSeconds) && !std::isinf(dSeconds)) {
        qint64 nMSecs = (qint64)((dSeconds + (double)APPLE_EPOCH_OFFSET) * 1000.0);

        dtResult = QDateTime::fromMSecsSinceEpoch(nMSecs, Qt::UTC);
    }

    return dtResult;
}

bool XBPList::parse(const QByteArray &baData)
{
    bool bResult = false;

    g_listObjects.clear();
    g_nTopIndex = -1;
    g_bDegraded = false;
    g_sErrorString.clear();

    if (isValid(baData)) {
        XDataReader reader(baData);

        TRAILER trailer = {};

        if (_readTrailer(reader, &trailer)) {
            bResult = _parseObjectTable(reader, trailer);
        }

        if (!bResult) {
#ifdef QT_DEBUG
            qDebug("XBPList: trailer is absent or inconsistent, scanning");
#endif
            emit warningMessage(tr("Binary property list is inconsistent, using a linear scan"));
            g_listObjects.clear();
            g_bDegraded = true;
            bResult = _parseDegraded(reader);
        }

        if (!bResult) {
            _error(tr("Cannot decode binary property list"));
        }
    } else {
        _error(tr("Invalid binary property list header"));
    }

    return bResult;
}

bool XBPList::isDegraded() const
{
    return g_bDegraded;
}

const QList<XBPList::OBJECT> &XBPList::getObjects() const
{
    return g_listObjects;
}

qint32 XBPList::getTopIndex() const
{
    return g_nTopIndex;
}

QString XBPList::getErrorString() const
{
    return g_sErrorString;
}

QVariant XBPList::toVariant() const
{
    return toVariant(g_nTopIndex);
}

QVariant XBPList::toVariant(qint32 nIndex) const
{
    QSet<qint32> stStack;

    return _toVariant(nIndex, &stStack);
}

bool XBPList::_readTrailer(const XDataReader &reader, TRAILER *pTrailer)
{
    bool bResult = false;

    qint64 nSize = reader.getSize();

    if (nSize >= (HEADER_SIZE + TRAILER_SIZE + 1)) {
        qint64 nTrailerOffset = nSize - TRAILER_SIZE;

        // 5 unused bytes and the sort version precede the fields
        pTrailer->nOffsetIntSize = reader.read_uint8(nTrailerOffset + 6);
        pTrailer->nObjectRefSize = reader.read_uint8(nTrailerOffset + 7);
        pTrailer->nNumberOfObjects = reader.read_uint64(nTrailerOffset + 8, true);
        pTrailer->nTopObject = reader.read_uint64(nTrailerOffset + 16, true);
        pTrailer->nOffsetTableOffset = reader.read_uint64(nTrailerOffset + 24, true);

        if ((pTrailer->nOffsetIntSize >= 1) && (pTrailer->nOffsetIntSize <= 8) && (pTrailer->nObjectRefSize >= 1) && (pTrailer->nObjectRefSize <= 8) &&
            (pTrailer->nNumberOfObjects > 0) && (pTrailer->nTopObject < pTrailer->nNumberOfObjects) && (pTrailer->nOffsetTableOffset >= (quint64)HEADER_SIZE) &&
            (pTrailer->nOffsetTableOffset < (quint64)nTrailerOffset)) {
            // Every object takes at least one byte
            quint64 nMaxObjects = pTrailer->nOffsetTableOffset - HEADER_SIZE;
            quint64 nTableSize = (quint64)nTrailerOffset - pTrailer->nOffsetTableOffset;

            if ((pTrailer->nNumberOfObjects <= nMaxObjects) && ((pTrailer->nNumberOfObjects * pTrailer->nOffsetIntSize) <= nTableSize)) {
                bResult = true;
            }
        }
    }

    return bResult;
}

bool XBPList::_parseObjectTable(const XDataReader &reader, const TRAILER &trailer)
{
    bool bResult = true;

    qint64 nNumberOfObjects = (qint64)trailer.nNumberOfObjects;
    qint64 nLimit = (qint64)trailer.nOffsetTableOffset;

    g_listObjects.reserve((qint32)nNumberOfObjects);

    for (qint64 i = 0; i < nNumberOfObjects; i++) {
        qint64 nObjectOffset = (qint64)reader.read_uintN(trailer.nOffsetTableOffset + i * trailer.nOffsetIntSize, trailer.nOffsetIntSize);

        OBJECT object = {};

        if ((nObjectOffset < HEADER_SIZE) || (nObjectOffset >= nLimit) ||
            (!_readObject(reader, nObjectOffset, nLimit, trailer.nObjectRefSize, nNumberOfObjects, &object))) {
#ifdef QT_DEBUG
            qDebug() << "XBPList: invalid object" << i << "at" << nObjectOffset;
#endif
            bResult = false;
            break;
        }

        g_listObjects.append(object);
    }

    if (bResult) {
        g_nTopIndex = (qint32)trailer.nTopObject;
    }

    return bResult;
}

bool XBPList::_readObject(const XDataReader &reader, qint64 nOffset, qint64 nLimit, quint8 nObjectRefSize, qint64 nNumberOfObjects, OBJECT *pObject)
{
    bool bResult = false;

    quint8 nMarker = reader.read_uint8(nOffset);
    quint8 nType = nMarker & 0xF0;
    quint8 nInfo = nMarker & 0x0F;

    if (nType == 0x00) {
        if (nMarker == MARKER_NULL || nMarker == MARKER_FILL) {
            pObject->vt = VT_NULL;
            bResult = true;
        } else if (nMarker == MARKER_FALSE || nMarker == MARKER_TRUE) {
            pObject->vt = VT_BOOL;
            pObject->varValue = (nMarker == MARKER_TRUE);
            bResult = true;
        }
    } else if (nType == MARKER_INT) {
        qint32 nSize = 1 << nInfo;

        if ((nInfo <= 4) && ((nOffset + 1 + nSize) <= nLimit)) {
            pObject->vt = VT_INTEGER;

            if (nSize == 16) {
                // 128-bit values keep the low 64 bits
                pObject->varValue = (qint64)reader.read_uint64(nOffset + 1 + 8, true);
            } else if (nSize == 8) {
                pObject->varValue = (qint64)reader.read_uint64(nOffset + 1, true);
            } else {
                pObject->varValue = (qint64)reader.read_uintN(nOffset + 1, nSize);
            }

            bResult = true;
        }
    } else if (nType == MARKER_REAL) {
        if ((nInfo == 2) && ((nOffset + 5) <= nLimit)) {
            pObject->vt = VT_REAL;
            pObject->varValue = (double)reader.read_float(nOffset + 1, true);
            bResult = true;
        } else if ((nInfo == 3) && ((nOffset + 9) <= nLimit)) {
            pObject->vt = VT_REAL;
            pObject->varValue = reader.read_double(nOffset + 1, true);
            bResult = true;
        }
    } else if (nMarker == MARKER_DATE) {
        if ((nOffset + 9) <= nLimit) {
            pObject->vt = VT_DATE;
            pObject->varValue = appleTimeToDateTime(reader.read_double(nOffset + 1, true));
            bResult = true;
        }
    } else if ((nType == MARKER_DATA) || (nType == MARKER_ASCIISTRING) || (nType == MARKER_UTF8STRING) || (nType == MARKER_UNICODE16STRING)) {
        qint64 nLength = 0;
        qint64 nDataOffset = 0;

        if (_readLength(reader, nOffset, nMarker, &nLength, &nDataOffset)) {
            qint64 nByteSize = (nType == MARKER_UNICODE16STRING) ? (nLength * 2) : nLength;

            if ((nDataOffset + nByteSize) <= nLimit) {
                QByteArray baValue = reader.read_array(nDataOffset, nByteSize);

                if (nType == MARKER_DATA) {
                    pObject->vt = VT_DATA;
                    pObject->varValue = baValue;
                } else if (nType == MARKER_ASCIISTRING) {
                    pObject->vt = VT_STRING;
                    pObject->varValue = QString::fromLatin1(baValue);
                } else if (nType == MARKER_UTF8STRING) {
                    pObject->vt = VT_STRING;
                    pObject->varValue = QString::fromUtf8(baValue);
                } else {
                    QString sValue;
                    sValue.reserve((qint32)nLength);

                    for (qint64 i = 0; i < nLength; i++) {
                        sValue.append(QChar((ushort)reader.read_uint16(nDataOffset + i * 2, true)));
                    }

                    pObject->vt = VT_STRING;
                    pObject->varValue = sValue;
                }

                bResult = true;
            }
        }
    } else if (nType == MARKER_UID) {
        qint32 nSize = nInfo + 1;

        if ((nSize <= 8) && ((nOffset + 1 + nSize) <= nLimit)) {
            pObject->vt = VT_UID;
            pObject->varValue = (qint64)reader.read_uintN(nOffset + 1, nSize);
            bResult = true;
        }
    } else if ((nType == MARKER_ARRAY) || (nType == MARKER_SET) || (nType == MARKER_DICT)) {
        qint64 nCount = 0;
        qint64 nDataOffset = 0;

        if (_readLength(reader, nOffset, nMarker, &nCount, &nDataOffset)) {
            qint64 nNumberOfRefs = (nType == MARKER_DICT) ? (nCount * 2) : nCount;

            if ((nNumberOfRefs <= nLimit) && ((nDataOffset + nNumberOfRefs * nObjectRefSize) <= nLimit)) {
                bResult = true;

                QList<qint32> listRefs;

                for (qint64 i = 0; i < nNumberOfRefs; i++) {
                    qint64 nRef = (qint64)reader.read_uintN(nDataOffset + i * nObjectRefSize, nObjectRefSize);

                    if (nRef >= nNumberOfObjects) {
                        bResult = false;
                        break;
                    }

                    listRefs.append((qint32)nRef);
                }

                if (bResult) {
                    if (nType == MARKER_DICT) {
                        pObject->vt = VT_DICT;
                        pObject->listKeyIndexes = listRefs.mid(0, (qint32)nCount);
                        pObject->listIndexes = listRefs.mid((qint32)nCount);
                    } else {
                        pObject->vt = (nType == MARKER_ARRAY) ? VT_ARRAY : VT_SET;
                        pObject->listIndexes = listRefs;
                    }
                }
            }
        }
    }

    return bResult;
}

bool XBPList::_readLength(const XDataReader &reader, qint64 nOffset, quint8 nMarker, qint64 *pnLength, qint64 *pnDataOffset)
{
    bool bResult = false;

    quint8 nInfo = nMarker & 0x0F;

    if (nInfo != 0x0F) {
        *pnLength = nInfo;
        *pnDataOffset = nOffset + 1;
        bResult = true;
    } else {
        // Out-of-line size is an integer object
        quint8 nIntMarker = reader.read_uint8(nOffset + 1);

        if ((nIntMarker & 0xF0) == MARKER_INT) {
            qint32 nSize = 1 << (nIntMarker & 0x0F);

            if ((nSize <= 8) && reader.isOffsetAndSizeValid(nOffset + 2, nSize)) {
                quint64 nLength = reader.read_uintN(nOffset + 2, nSize);

                if (nLength <= (quint64)reader.getSize()) {
                    *pnLength = (qint64)nLength;
                    *pnDataOffset = nOffset + 2 + nSize;
                    bResult = true;
                }
            }
        }
    }

    return bResult;
}

bool XBPList::_parseDegraded(const XDataReader &reader)
{
    bool bResult = false;

    qint64 nSize = reader.getSize();
    qint64 nEnd = (nSize > (HEADER_SIZE + TRAILER_SIZE)) ? (nSize - TRAILER_SIZE) : nSize;

    OBJECT root = {};
    root.vt = VT_ARRAY;

    for (qint64 nOffset = HEADER_SIZE; nOffset < nEnd;) {
        quint8 nMarker = reader.read_uint8(nOffset);
        quint8 nType = nMarker & 0xF0;

        OBJECT object = {};
        qint64 nNext = nOffset + 1;
        bool bFound = false;

        if ((nType == MARKER_ASCIISTRING) || (nType == MARKER_UTF8STRING) || (nType == MARKER_UNICODE16STRING)) {
            qint64 nLength = 0;
            qint64 nDataOffset = 0;

            if (_readLength(reader, nOffset, nMarker, &nLength, &nDataOffset) && (nLength > 0)) {
                qint64 nByteSize = (nType == MARKER_UNICODE16STRING) ? (nLength * 2) : nLength;

                if ((nDataOffset + nByteSize) <= nEnd) {
                    bFound = _readObject(reader, nOffset, nEnd, 1, 0, &object);
                    nNext = nDataOffset + nByteSize;
                }
            }
        } else if (nType == MARKER_INT) {
            if ((nMarker & 0x0F) <= 3) {
                qint32 nIntSize = 1 << (nMarker & 0x0F);

                if ((nOffset + 1 + nIntSize) <= nEnd) {
                    bFound = _readObject(reader, nOffset, nEnd, 1, 0, &object);
                    nNext = nOffset + 1 + nIntSize;
                }
            }
        }

        if (bFound) {
            root.listIndexes.append(g_listObjects.count());
            g_listObjects.append(object);
            nOffset = nNext;
        } else {
            nOffset++;
        }
    }

    if (g_listObjects.count()) {
        g_nTopIndex = g_listObjects.count();
        g_listObjects.append(root);
        bResult = true;
    }

    return bResult;
}

QVariant XBPList::_toVariant(qint32 nIndex, QSet<qint32> *pStack) const
{
    QVariant varResult;

    if ((nIndex >= 0) && (nIndex < g_listObjects.count()) && (!pStack->contains(nIndex))) {
        const OBJECT &object = g_listObjects.at(nIndex);

        if ((object.vt == VT_ARRAY) || (object.vt == VT_SET) || (object.vt == VT_DICT)) {
            pStack->insert(nIndex);

            if (object.vt == VT_DICT) {
                QVariantMap mapResult;

                qint32 nNumberOfKeys = object.listKeyIndexes.count();

                for (qint32 i = 0; i < nNumberOfKeys; i++) {
                    QString sKey = _toVariant(object.listKeyIndexes.at(i), pStack).toString();
                    mapResult.insert(sKey, _toVariant(object.listIndexes.at(i), pStack));
                }

                varResult = mapResult;
            } else {
                QVariantList listResult;

                qint32 nNumberOfElements = object.listIndexes.count();

                for (qint32 i = 0; i < nNumberOfElements; i++) {
                    listResult.append(_toVariant(object.listIndexes.at(i), pStack));
                }

                varResult = listResult;
            }

            pStack->remove(nIndex);
        } else if (object.vt == VT_UID) {
            QVariantMap mapUID;
            mapUID.insert("CF$UID", object.varValue);
            varResult = mapUID;
        } else {
            varResult = object.varValue;
        }
    }

    return varResult;
}

void XBPList::_error(const QString &sText)
{
    g_sErrorString = sText;

    emit errorMessage(sText);
}
