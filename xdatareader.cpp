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
#include "xdatareader.h"

#include <QtEndian>

#include <cstring>

XDataReader::XDataReader(const QByteArray &baData) : g_baData(baData)
{
}

qint64 XDataReader::getSize() const
{
    return g_baData.size();
}

bool XDataReader::isOffsetValid(qint64 nOffset) const
{
    return (nOffset >= 0) && (nOffset < getSize());
}

bool XDataReader::isOffsetAndSizeValid(qint64 nOffset, qint64 nSize) const
{
    bool bResult = false;

    if ((nOffset >= 0) && (nSize >= 0)) {
        bResult = (nOffset <= getSize()) && (nSize <= (getSize() - nOffset));
    }

    return bResult;
}

quint8 XDataReader::read_uint8(qint64 nOffset) const
{
    quint8 nResult = 0;

    if (isOffsetAndSizeValid(nOffset, 1)) {
        nResult = (quint8)g_baData.at((qint32)nOffset);
    }

    return nResult;
}

quint16 XDataReader::read_uint16(qint64 nOffset, bool bIsBigEndian) const
{
    quint16 nResult = 0;

    if (isOffsetAndSizeValid(nOffset, 2)) {
        const uchar *pData = (const uchar *)(g_baData.constData() + nOffset);

        if (bIsBigEndian) {
            nResult = qFromBigEndian<quint16>(pData);
        } else {
            nResult = qFromLittleEndian<quint16>(pData);
        }
    }

    return nResult;
}

quint32 XDataReader::read_uint32(qint64 nOffset, bool bIsBigEndian) const
{
    quint32 nResult = 0;

    if (isOffsetAndSizeValid(nOffset, 4)) {
        const uchar *pData = (const uchar *)(g_baData.constData() + nOffset);

        if (bIsBigEndian) {
            nResult = qFromBigEndian<quint32>(pData);
        } else {
            nResult = qFromLittleEndian<quint32>(pData);
        }
    }

    return nResult;
}

quint64 XDataReader::read_uint64(qint64 nOffset, bool bIsBigEndian) const
{
    quint64 nResult = 0;

    if (isOffsetAndSizeValid(nOffset, 8)) {
        const uchar *pData = (const uchar *)(g_baData.constData() + nOffset);

        if (bIsBigEndian) {
            nResult = qFromBigEndian<quint64>(pData);
        } else {
            nResult = qFromLittleEndian<quint64>(pData);
        }
    }

    return nResult;
}

quint64 XDataReader::read_uintN(qint64 nOffset, qint32 nSize) const
{
    quint64 nResult = 0;

    if ((nSize > 0) && (nSize <= 8) && isOffsetAndSizeValid(nOffset, nSize)) {
        for (qint32 i = 0; i < nSize; i++) {
            nResult = (nResult << 8) | (quint8)g_baData.at((qint32)(nOffset + i));
        }
    }

    return nResult;
}

float XDataReader::read_float(qint64 nOffset, bool bIsBigEndian) const
{
    quint32 nValue = read_uint32(nOffset, bIsBigEndian);

    float fResult = 0;
    memcpy(&fResult, &nValue, sizeof(fResult));

    return fResult;
}

double XDataReader::read_double(qint64 nOffset, bool bIsBigEndian) const
{
    quint64 nValue = read_uint64(nOffset, bIsBigEndian);

    double dResult = 0;
    memcpy(&dResult, &nValue, sizeof(dResult));

    return dResult;
}

QByteArray XDataReader::read_array(qint64 nOffset, qint64 nSize) const
{
    QByteArray baResult;

    if (isOffsetAndSizeValid(nOffset, nSize)) {
        baResult = g_baData.mid((qint32)nOffset, (qint32)nSize);
    }

    return baResult;
}

QString XDataReader::read_ansiString(qint64 nOffset, qint64 nSize) const
{
    return QString::fromLatin1(read_array(nOffset, nSize));
}

qint64 XDataReader::find_uint32(qint64 nOffset, qint64 nSize, quint32 nValue, bool bBackward) const
{
    qint64 nResult = -1;

    if (nSize == -1) {
        nSize = getSize() - nOffset;
    }

    if (isOffsetAndSizeValid(nOffset, nSize) && (nSize >= 4)) {
        qint64 nLast = nOffset + nSize - 4;

        if (bBackward) {
            for (qint64 i = nLast; i >= nOffset; i--) {
                if (read_uint32(i) == nValue) {
                    nResult = i;
                    break;
                }
            }
        } else {
            for (qint64 i = nOffset; i <= nLast; i++) {
                if (read_uint32(i) == nValue) {
                    nResult = i;
                    break;
                }
            }
        }
    }

    return nResult;
}

qint32 XDataReader::_readDevice(char *pBuffer, qint32 nBufferSize, DATAPROCESS_STATE *pState)
{
    qint32 nResult = 0;

    if ((nBufferSize > 0) && (!pState->bReadError)) {
        qint64 nRead = pState->pDeviceInput->read(pBuffer, nBufferSize);

        if (nRead < 0) {
            pState->bReadError = true;
        } else {
            nResult = (qint32)nRead;
            pState->nCountInput += nRead;
        }
    }

    return nResult;
}

bool XDataReader::_writeDevice(char *pBuffer, qint32 nBufferSize, DATAPROCESS_STATE *pState)
{
    bool bResult = false;

    if (!pState->bWriteError) {
        qint64 nWritten = pState->pDeviceOutput->write(pBuffer, nBufferSize);

        if (nWritten == nBufferSize) {
            pState->nCountOutput += nWritten;
            bResult = true;
        } else {
            pState->bWriteError = true;
        }
    }

    return bResult;
}

XDataReader::DATAPROCESS_STATE XDataReader::createDataProcessState(QIODevice *pDeviceInput, QIODevice *pDeviceOutput, qint64 nInputOffset, qint64 nInputLimit)
{
    DATAPROCESS_STATE result = {};

    result.pDeviceInput = pDeviceInput;
    result.pDeviceOutput = pDeviceOutput;
    result.nInputOffset = nInputOffset;
    result.nInputLimit = nInputLimit;

    return result;
}
