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
#include "xpkgzip.h"

#include <QBuffer>
#include <QDebug>

#include <cstddef>

XPkgZip::XPkgZip(const QByteArray &baData, QObject *parent) : QObject(parent), g_baData(baData), g_reader(baData)
{
}

bool XPkgZip::isValid()
{
    return (findECDOffset() != -1);
}

qint64 XPkgZip::findECDOffset()
{
    qint64 nResult = -1;
    qint64 nSize = g_reader.getSize();

    if (nSize >= (qint64)sizeof(ENDOFCENTRALDIRECTORYRECORD)) {
        // The record is fixed size plus a comment of at most 0xFFFF bytes
        qint64 nWindow = qMin(nSize, (qint64)(0xFFFF + sizeof(ENDOFCENTRALDIRECTORYRECORD)));
        qint64 nStart = nSize - nWindow;
        qint64 nLast = nSize - sizeof(ENDOFCENTRALDIRECTORYRECORD);

        for (qint64 nCurrent = nLast; nCurrent >= nStart; nCurrent--) {
            nCurrent = g_reader.find_uint32(nStart, (nCurrent - nStart) + 4, SIGNATURE_ECD, true);

            if (nCurrent == -1) {
                break;
            }

            quint16 nNumberOfRecords = g_reader.read_uint16(nCurrent + offsetof(ENDOFCENTRALDIRECTORYRECORD, nTotalNumberOfRecords));
            qint64 nOffsetToCentralDirectory = g_reader.read_uint32(nCurrent + offsetof(ENDOFCENTRALDIRECTORYRECORD, nOffsetToCentralDirectory));
            qint64 nSizeOfCentralDirectory = g_reader.read_uint32(nCurrent + offsetof(ENDOFCENTRALDIRECTORYRECORD, nSizeOfCentralDirectory));

            if ((nOffsetToCentralDirectory + nSizeOfCentralDirectory) > nCurrent) {
                continue;
            }

            if (nNumberOfRecords) {
                quint32 nCFDSignature = g_reader.read_uint32(nOffsetToCentralDirectory + offsetof(CENTRALDIRECTORYFILEHEADER, nSignature));

                if (nCFDSignature != SIGNATURE_CFD) {
                    continue;
                }
            }

            nResult = nCurrent;

            break;
        }
    }

    return nResult;
}

bool XPkgZip::readRecords(QList<RECORD> *pListRecords)
{
#ifdef QT_DEBUG
    qDebug("XPkgZip::readRecords");
#endif

    bool bResult = false;

    pListRecords->clear();

    qint64 nECDOffset = findECDOffset();

    if (nECDOffset != -1) {
        qint32 nNumberOfRecords = g_reader.read_uint16(nECDOffset + offsetof(ENDOFCENTRALDIRECTORYRECORD, nTotalNumberOfRecords));
        qint64 nOffset = g_reader.read_uint32(nECDOffset + offsetof(ENDOFCENTRALDIRECTORYRECORD, nOffsetToCentralDirectory));

        bResult = true;

        for (qint32 i = 0; i < nNumberOfRecords; i++) {
            if (!g_reader.isOffsetAndSizeValid(nOffset, sizeof(CENTRALDIRECTORYFILEHEADER)) || ((nOffset + (qint64)sizeof(CENTRALDIRECTORYFILEHEADER)) > nECDOffset)) {
                _error(QString("%1: %2").arg(tr("Invalid central directory"), QString::number(i)));
                bResult = false;
                break;
            }

            CENTRALDIRECTORYFILEHEADER cdh = read_CENTRALDIRECTORYFILEHEADER(nOffset);

            if (cdh.nSignature != SIGNATURE_CFD) {
                _error(QString("%1: %2").arg(tr("Invalid central directory signature"), QString::number(i)));
                bResult = false;
                break;
            }

            qint64 nRecordSize = sizeof(CENTRALDIRECTORYFILEHEADER) + cdh.nFileNameLength + cdh.nExtraFieldLength + cdh.nFileCommentLength;

            if ((nOffset + nRecordSize) > nECDOffset) {
                _error(QString("%1: %2").arg(tr("Invalid central directory"), QString::number(i)));
                bResult = false;
                break;
            }

            RECORD record = {};

            QByteArray baFileName = g_reader.read_array(nOffset + sizeof(CENTRALDIRECTORYFILEHEADER), cdh.nFileNameLength);

            if (cdh.nFlags & FLAG_UTF8) {
                record.sFileName = QString::fromUtf8(baFileName);
            } else {
                record.sFileName = QString::fromLatin1(baFileName);
            }

            record.nMethod = cdh.nMethod;
            record.nFlags = cdh.nFlags;
            record.nCRC32 = cdh.nCRC32;
            record.nCompressedSize = cdh.nCompressedSize;
            record.nUncompressedSize = cdh.nUncompressedSize;
            record.nHeaderOffset = cdh.nOffsetToLocalFileHeader;

            if (!g_reader.isOffsetAndSizeValid(record.nHeaderOffset, sizeof(LOCALFILEHEADER))) {
                _error(QString("%1: %2").arg(tr("Invalid local file header"), record.sFileName));
                bResult = false;
                break;
            }

            LOCALFILEHEADER lfh = read_LOCALFILEHEADER(record.nHeaderOffset);

            if (lfh.nSignature != SIGNATURE_LFD) {
                _error(QString("%1: %2").arg(tr("Invalid local file header signature"), record.sFileName));
                bResult = false;
                break;
            }

            record.nDataOffset = record.nHeaderOffset + sizeof(LOCALFILEHEADER) + lfh.nFileNameLength + lfh.nExtraFieldLength;

            pListRecords->append(record);

            nOffset += nRecordSize;
        }
    } else {
        _error(tr("End of central directory not found"));
    }

    if (!bResult) {
        pListRecords->clear();
    }

    return bResult;
}

QList<XPkgZip::RECORD> XPkgZip::getRecords()
{
    QList<RECORD> listResult;

    readRecords(&listResult);

    return listResult;
}

QList<XPkgZip::RECORD> XPkgZip::findRecords(const QRegularExpression &regExp)
{
    QList<RECORD> listResult;
    QList<RECORD> listRecords = getRecords();

    qint32 nNumberOfRecords = listRecords.count();

    for (qint32 i = 0; i < nNumberOfRecords; i++) {
        if (regExp.match(listRecords.at(i).sFileName).hasMatch()) {
            listResult.append(listRecords.at(i));
        }
    }

    return listResult;
}

bool XPkgZip::findRecord(const QString &sFileName, RECORD *pRecord)
{
    bool bResult = false;

    QList<RECORD> listRecords = getRecords();

    qint32 nNumberOfRecords = listRecords.count();

    for (qint32 i = 0; i < nNumberOfRecords; i++) {
        if (listRecords.at(i).sFileName == sFileName) {
            *pRecord = listRecords.at(i);
            bResult = true;
            break;
        }
    }

    return bResult;
}

bool XPkgZip::decompress(const RECORD &record, QByteArray *pbaResult)
{
    bool bResult = false;

    pbaResult->clear();

    if (record.nFlags & FLAG_ENCRYPTED) {
        emit warningMessage(QString("%1: %2").arg(tr("Encrypted entry"), record.sFileName));
    } else if ((record.nMethod != CMETHOD_STORE) && (record.nMethod != CMETHOD_DEFLATE)) {
        emit warningMessage(QString("%1 %2: %3").arg(tr("Unsupported compression method"), QString::number(record.nMethod), record.sFileName));
    } else if (!g_reader.isOffsetAndSizeValid(record.nDataOffset, record.nCompressedSize)) {
        emit warningMessage(QString("%1: %2").arg(tr("Entry data is out of bounds"), record.sFileName));
    } else {
        QBuffer bufferIn;
        bufferIn.setData(g_baData);

        QByteArray baOutput;
        QBuffer bufferOut(&baOutput);

        if (bufferIn.open(QIODevice::ReadOnly) && bufferOut.open(QIODevice::WriteOnly)) {
            XDataReader::DATAPROCESS_STATE state = XDataReader::createDataProcessState(&bufferIn, &bufferOut, record.nDataOffset, record.nCompressedSize);

            bool bDecompressed = false;

            if (record.nMethod == CMETHOD_STORE) {
                bDecompressed = XStoreDecoder::decompress(&state);
            } else {
                bDecompressed = XDeflateDecoder::decompress(&state);
            }

            bufferOut.close();
            bufferIn.close();

            if (!bDecompressed) {
                emit warningMessage(QString("%1: %2").arg(tr("Cannot decompress entry"), record.sFileName));
            } else if (baOutput.size() != record.nUncompressedSize) {
                emit warningMessage(QString("%1: %2").arg(tr("Invalid uncompressed size"), record.sFileName));
            } else if (XDeflateDecoder::getCRC32(baOutput) != record.nCRC32) {
                emit warningMessage(QString("%1: %2").arg(tr("Invalid CRC"), record.sFileName));
            } else {
                *pbaResult = baOutput;
                bResult = true;
            }
        }
    }

    return bResult;
}

bool XPkgZip::decompress(const QString &sFileName, QByteArray *pbaResult)
{
    bool bResult = false;

    RECORD record = {};

    if (findRecord(sFileName, &record)) {
        bResult = decompress(record, pbaResult);
    } else {
        pbaResult->clear();
        emit warningMessage(QString("%1: %2").arg(tr("Entry not found"), sFileName));
    }

    return bResult;
}

QMap<QString, QByteArray> XPkgZip::decompressRecords(const QList<RECORD> &listRecords)
{
    QMap<QString, QByteArray> mapResult;

    qint32 nNumberOfRecords = listRecords.count();

    for (qint32 i = 0; i < nNumberOfRecords; i++) {
        QByteArray baData;

        if (decompress(listRecords.at(i), &baData)) {
            mapResult.insert(listRecords.at(i).sFileName, baData);
        }
    }

    return mapResult;
}

QString XPkgZip::getErrorString() const
{
    return g_sErrorString;
}

XPkgZip::CENTRALDIRECTORYFILEHEADER XPkgZip::read_CENTRALDIRECTORYFILEHEADER(qint64 nOffset)
{
    CENTRALDIRECTORYFILEHEADER result = {};

    result.nSignature = g_reader.read_uint32(nOffset + offsetof(CENTRALDIRECTORYFILEHEADER, nSignature));
    result.nVersion = g_reader.read_uint8(nOffset + offsetof(CENTRALDIRECTORYFILEHEADER, nVersion));
    result.nOS = g_reader.read_uint8(nOffset + offsetof(CENTRALDIRECTORYFILEHEADER, nOS));
    result.nMinVersion = g_reader.read_uint8(nOffset + offsetof(CENTRALDIRECTORYFILEHEADER, nMinVersion));
    result.nMinOS = g_reader.read_uint8(nOffset + offsetof(CENTRALDIRECTORYFILEHEADER, nMinOS));
    result.nFlags = g_reader.read_uint16(nOffset + offsetof(CENTRALDIRECTORYFILEHEADER, nFlags));
    result.nMethod = g_reader.read_uint16(nOffset + offsetof(CENTRALDIRECTORYFILEHEADER, nMethod));
    result.nLastModTime = g_reader.read_uint16(nOffset + offsetof(CENTRALDIRECTORYFILEHEADER, nLastModTime));
    result.nLastModDate = g_reader.read_uint16(nOffset + offsetof(CENTRALDIRECTORYFILEHEADER, nLastModDate));
    result.nCRC32 = g_reader.read_uint32(nOffset + offsetof(CENTRALDIRECTORYFILEHEADER, nCRC32));
    result.nCompressedSize = g_reader.read_uint32(nOffset + offsetof(CENTRALDIRECTORYFILEHEADER, nCompressedSize));
    result.nUncompressedSize = g_reader.read_uint32(nOffset + offsetof(CENTRALDIRECTORYFILEHEADER, nUncompressedSize));
    result.nFileNameLength = g_reader.read_uint16(nOffset + offsetof(CENTRALDIRECTORYFILEHEADER, nFileNameLength));
    result.nExtraFieldLength = g_reader.read_uint16(nOffset + offsetof(CENTRALDIRECTORYFILEHEADER, nExtraFieldLength));
    result.nFileCommentLength = g_reader.read_uint16(nOffset + offsetof(CENTRALDIRECTORYFILEHEADER, nFileCommentLength));
    result.nStartDisk = g_reader.read_uint16(nOffset + offsetof(CENTRALDIRECTORYFILEHEADER, nStartDisk));
    result.nInternalFileAttributes = g_reader.read_uint16(nOffset + offsetof(CENTRALDIRECTORYFILEHEADER, nInternalFileAttributes));
    result.nExternalFileAttributes = g_reader.read_uint32(nOffset + offsetof(CENTRALDIRECTORYFILEHEADER, nExternalFileAttributes));
    result.nOffsetToLocalFileHeader = g_reader.read_uint32(nOffset + offsetof(CENTRALDIRECTORYFILEHEADER, nOffsetToLocalFileHeader));

    return result;
}

XPkgZip::LOCALFILEHEADER XPkgZip::read_LOCALFILEHEADER(qint64 nOffset)
{
    LOCALFILEHEADER result = {};

    result.nSignature = g_reader.read_uint32(nOffset + offsetof(LOCALFILEHEADER, nSignature));
    result.nMinVersion = g_reader.read_uint8(nOffset + offsetof(LOCALFILEHEADER, nMinVersion));
    result.nMinOS = g_reader.read_uint8(nOffset + offsetof(LOCALFILEHEADER, nMinOS));
    result.nFlags = g_reader.read_uint16(nOffset + offsetof(LOCALFILEHEADER, nFlags));
    result.nMethod = g_reader.read_uint16(nOffset + offsetof(LOCALFILEHEADER, nMethod));
    result.nLastModTime = g_reader.read_uint16(nOffset + offsetof(LOCALFILEHEADER, nLastModTime));
    result.nLastModDate = g_reader.read_uint16(nOffset + offsetof(LOCALFILEHEADER, nLastModDate));
    result.nCRC32 = g_reader.read_uint32(nOffset + offsetof(LOCALFILEHEADER, nCRC32));
    result.nCompressedSize = g_reader.read_uint32(nOffset + offsetof(LOCALFILEHEADER, nCompressedSize));
    result.nUncompressedSize = g_reader.read_uint32(nOffset + offsetof(LOCALFILEHEADER, nUncompressedSize));
    result.nFileNameLength = g_reader.read_uint16(nOffset + offsetof(LOCALFILEHEADER, nFileNameLength));
    result.nExtraFieldLength = g_reader.read_uint16(nOffset + offsetof(LOCALFILEHEADER, nExtraFieldLength));

    return result;
}

bool XPkgZip::addLocalFileRecord(const QByteArray &baSource, QIODevice *pDest, RECORD *pRecord, CMETHOD method, qint32 nCompressionLevel)
{
    bool bResult = false;

    QByteArray baCompressed;

    if (method == CMETHOD_DEFLATE) {
        QBuffer bufferIn;
        bufferIn.setData(baSource);
        QBuffer bufferOut(&baCompressed);

        if (bufferIn.open(QIODevice::ReadOnly) && bufferOut.open(QIODevice::WriteOnly)) {
            XDataReader::DATAPROCESS_STATE state = XDataReader::createDataProcessState(&bufferIn, &bufferOut, 0, baSource.size());

            bResult = XDeflateDecoder::compress(&state, nCompressionLevel);

            bufferOut.close();
            bufferIn.close();
        }
    } else {
        baCompressed = baSource;
        bResult = true;
    }

    if (bResult) {
        QByteArray baFileName = pRecord->sFileName.toUtf8();

        pRecord->nMethod = method;
        pRecord->nFlags = FLAG_UTF8;
        pRecord->nCRC32 = XDeflateDecoder::getCRC32(baSource);
        pRecord->nCompressedSize = baCompressed.size();
        pRecord->nUncompressedSize = baSource.size();
        pRecord->nHeaderOffset = pDest->pos();

        LOCALFILEHEADER localFileHeader = {};
        localFileHeader.nSignature = SIGNATURE_LFD;
        localFileHeader.nMinVersion = 0x14;
        localFileHeader.nFlags = pRecord->nFlags;
        localFileHeader.nMethod = pRecord->nMethod;
        localFileHeader.nCRC32 = pRecord->nCRC32;
        localFileHeader.nCompressedSize = (quint32)pRecord->nCompressedSize;
        localFileHeader.nUncompressedSize = (quint32)pRecord->nUncompressedSize;
        localFileHeader.nFileNameLength = (quint16)baFileName.size();
        localFileHeader.nExtraFieldLength = 0;

        pDest->write((char *)&localFileHeader, sizeof(localFileHeader));
        pDest->write(baFileName.data(), baFileName.size());

        pRecord->nDataOffset = pDest->pos();

        bResult = (pDest->write(baCompressed) == baCompressed.size());
    }

    return bResult;
}

bool XPkgZip::addCentralDirectory(QIODevice *pDest, QList<RECORD> *pListRecords, const QString &sComment)
{
    bool bResult = true;

    qint64 nStartPosition = pDest->pos();

    qint32 nNumberOfRecords = pListRecords->count();

    for (qint32 i = 0; i < nNumberOfRecords; i++) {
        QByteArray baFileName = pListRecords->at(i).sFileName.toUtf8();

        CENTRALDIRECTORYFILEHEADER cdFileHeader = {};

        cdFileHeader.nSignature = SIGNATURE_CFD;
        cdFileHeader.nVersion = 0x3F;
        cdFileHeader.nMinVersion = 0x14;
        cdFileHeader.nFlags = pListRecords->at(i).nFlags;
        cdFileHeader.nMethod = pListRecords->at(i).nMethod;
        cdFileHeader.nCRC32 = pListRecords->at(i).nCRC32;
        cdFileHeader.nCompressedSize = (quint32)pListRecords->at(i).nCompressedSize;
        cdFileHeader.nUncompressedSize = (quint32)pListRecords->at(i).nUncompressedSize;
        cdFileHeader.nFileNameLength = (quint16)baFileName.size();
        cdFileHeader.nOffsetToLocalFileHeader = (quint32)pListRecords->at(i).nHeaderOffset;

        pDest->write((char *)&cdFileHeader, sizeof(cdFileHeader));
        pDest->write(baFileName.data(), baFileName.size());
    }

    qint64 nCentralDirectorySize = pDest->pos() - nStartPosition;

    QByteArray baComment = sComment.toUtf8();

    ENDOFCENTRALDIRECTORYRECORD endofCD = {};

    endofCD.nSignature = SIGNATURE_ECD;
    endofCD.nDiskNumberOfRecords = (quint16)nNumberOfRecords;
    endofCD.nTotalNumberOfRecords = (quint16)nNumberOfRecords;
    endofCD.nSizeOfCentralDirectory = (quint32)nCentralDirectorySize;
    endofCD.nOffsetToCentralDirectory = (quint32)nStartPosition;
    endofCD.nCommentLength = (quint16)baComment.size();

    if (pDest->write((char *)&endofCD, sizeof(endofCD)) != sizeof(endofCD)) {
        bResult = false;
    }

    pDest->write(baComment.data(), baComment.size());

    return bResult;
}

QByteArray XPkgZip::createArchive(const QList<QPair<QString, QByteArray>> &listFiles, CMETHOD method, qint32 nCompressionLevel)
{
    QByteArray baResult;
    QBuffer buffer(&baResult);

    if (buffer.open(QIODevice::WriteOnly)) {
        QList<RECORD> listRecords;

        bool bSuccess = true;

        qint32 nNumberOfFiles = listFiles.count();

        for (qint32 i = 0; (i < nNumberOfFiles) && bSuccess; i++) {
            RECORD record = {};
            record.sFileName = listFiles.at(i).first;

            bSuccess = addLocalFileRecord(listFiles.at(i).second, &buffer, &record, method, nCompressionLevel);

            listRecords.append(record);
        }

        if (bSuccess) {
            bSuccess = addCentralDirectory(&buffer, &listRecords);
        }

        buffer.close();

        if (!bSuccess) {
            baResult.clear();
        }
    }

    return baResult;
}

void XPkgZip::_error(const QString &sText)
{
    g_sErrorString = sText;

    emit errorMessage(sText);
}
