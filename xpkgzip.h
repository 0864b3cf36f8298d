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
#ifndef XPKGZIP_H
#define XPKGZIP_H

#include "xdatareader.h"
#include "xdeflatedecoder.h"
#include "xstoredecoder.h"

#include <QList>
#include <QMap>
#include <QObject>
#include <QPair>
#include <QRegularExpression>

class XPkgZip : public QObject {
    Q_OBJECT

public:
    enum SIGNATURE {
        SIGNATURE_ECD = 0x06054B50,
        SIGNATURE_CFD = 0x02014B50,
        SIGNATURE_LFD = 0x04034B50
    };

    //    0 - The file is stored (no compression)
    //    8 - The file is Deflated
    // Anything else is reported per entry and skipped
    enum CMETHOD {
        CMETHOD_STORE = 0,
        CMETHOD_DEFLATE = 8
    };

    enum FLAG {
        FLAG_ENCRYPTED = 0x0001,
        FLAG_DATADESCRIPTOR = 0x0008,
        FLAG_UTF8 = 0x0800
    };

#pragma pack(push)
#pragma pack(1)
    struct LOCALFILEHEADER {
        quint32 nSignature;  // SIGNATURE_LFD
        quint8 nMinVersion;
        quint8 nMinOS;
        quint16 nFlags;
        quint16 nMethod;
        quint16 nLastModTime;
        quint16 nLastModDate;
        quint32 nCRC32;
        quint32 nCompressedSize;
        quint32 nUncompressedSize;
        quint16 nFileNameLength;
        quint16 nExtraFieldLength;
        // File name
        // Extra field
    };

    struct ENDOFCENTRALDIRECTORYRECORD {
        quint32 nSignature;  // SIGNATURE_ECD
        quint16 nDiskNumber;
        quint16 nStartDisk;
        quint16 nDiskNumberOfRecords;
        quint16 nTotalNumberOfRecords;
        quint32 nSizeOfCentralDirectory;
        quint32 nOffsetToCentralDirectory;
        quint16 nCommentLength;
        // Comment
    };

    struct CENTRALDIRECTORYFILEHEADER {
        quint32 nSignature;  // SIGNATURE_CFD
        quint8 nVersion;
        quint8 nOS;
        quint8 nMinVersion;
        quint8 nMinOS;
        quint16 nFlags;
        quint16 nMethod;
        quint16 nLastModTime;
        quint16 nLastModDate;
        quint32 nCRC32;
        quint32 nCompressedSize;
        quint32 nUncompressedSize;
        quint16 nFileNameLength;
        quint16 nExtraFieldLength;
        quint16 nFileCommentLength;
        quint16 nStartDisk;
        quint16 nInternalFileAttributes;
        quint32 nExternalFileAttributes;
        quint32 nOffsetToLocalFileHeader;
        // File name
        // Extra field
        // File Comment
    };
#pragma pack(pop)

    struct RECORD {
        QString sFileName;
        quint16 nMethod;
        quint16 nFlags;
        quint32 nCRC32;
        qint64 nCompressedSize;
        qint64 nUncompressedSize;
        qint64 nHeaderOffset;
        qint64 nDataOffset;
    };

    explicit XPkgZip(const QByteArray &baData, QObject *parent = nullptr);

    bool isValid();
    qint64 findECDOffset();
    bool readRecords(QList<RECORD> *pListRecords);
    QList<RECORD> getRecords();
    QList<RECORD> findRecords(const QRegularExpression &regExp);
    bool findRecord(const QString &sFileName, RECORD *pRecord);

    bool decompress(const RECORD &record, QByteArray *pbaResult);
    bool decompress(const QString &sFileName, QByteArray *pbaResult);
    QMap<QString, QByteArray> decompressRecords(const QList<RECORD> &listRecords);

    QString getErrorString() const;

    CENTRALDIRECTORYFILEHEADER read_CENTRALDIRECTORYFILEHEADER(qint64 nOffset);
    LOCALFILEHEADER read_LOCALFILEHEADER(qint64 nOffset);

    static bool addLocalFileRecord(const QByteArray &baSource, QIODevice *pDest, RECORD *pRecord, CMETHOD method,
                                   qint32 nCompressionLevel = Z_DEFAULT_COMPRESSION);
    static bool addCentralDirectory(QIODevice *pDest, QList<RECORD> *pListRecords, const QString &sComment = "");
    static QByteArray createArchive(const QList<QPair<QString, QByteArray>> &listFiles, CMETHOD method, qint32 nCompressionLevel = Z_DEFAULT_COMPRESSION);

private:
    void _error(const QString &sText);

signals:
    void errorMessage(const QString &sText);
    void warningMessage(const QString &sText);

private:
    QByteArray g_baData;
    XDataReader g_reader;
    QString g_sErrorString;
};

#endif  // XPKGZIP_H
