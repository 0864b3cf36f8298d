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
#ifndef XDATAREADER_H
#define XDATAREADER_H

#include <QByteArray>
#include <QIODevice>
#include <QString>

class XDataReader {
public:
    struct DATAPROCESS_STATE {
        QIODevice *pDeviceInput;
        QIODevice *pDeviceOutput;
        qint64 nInputOffset;
        qint64 nInputLimit;
        qint64 nCountInput;
        qint64 nCountOutput;
        bool bReadError;
        bool bWriteError;
    };

    explicit XDataReader(const QByteArray &baData);

    qint64 getSize() const;
    bool isOffsetValid(qint64 nOffset) const;
    bool isOffsetAndSizeValid(qint64 nOffset, qint64 nSize) const;

    quint8 read_uint8(qint64 nOffset) const;
    quint16 read_uint16(qint64 nOffset, bool bIsBigEndian = false) const;
    quint32 read_uint32(qint64 nOffset, bool bIsBigEndian = false) const;
    quint64 read_uint64(qint64 nOffset, bool bIsBigEndian = false) const;
    // Big-endian unsigned value of 1..8 bytes
    quint64 read_uintN(qint64 nOffset, qint32 nSize) const;
    float read_float(qint64 nOffset, bool bIsBigEndian = false) const;
    double read_double(qint64 nOffset, bool bIsBigEndian = false) const;
    QByteArray read_array(qint64 nOffset, qint64 nSize) const;
    QString read_ansiString(qint64 nOffset, qint64 nSize) const;

    qint64 find_uint32(qint64 nOffset, qint64 nSize, quint32 nValue, bool bBackward = false) const;

    static qint32 _readDevice(char *pBuffer, qint32 nBufferSize, DATAPROCESS_STATE *pState);
    static bool _writeDevice(char *pBuffer, qint32 nBufferSize, DATAPROCESS_STATE *pState);
    static DATAPROCESS_STATE createDataProcessState(QIODevice *pDeviceInput, QIODevice *pDeviceOutput, qint64 nInputOffset, qint64 nInputLimit);

private:
    QByteArray g_baData;
};

#endif  // XDATAREADER_H
