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
#include <gtest/gtest.h>

#include "testdata.h"
#include "xpkgzip.h"

#include <QBuffer>

#include <stddef.h>

static QList<QPair<QString, QByteArray>> _createFiles()
{
    QByteArray baBinary;

    for (qint32 i = 0; i < 4096; i++) {
        baBinary.append((char)((i * 7) & 0xFF));
    }

    QList<QPair<QString, QByteArray>> listResult;
    listResult.append(qMakePair(QString("notes.txt"), QByteArray("MarginNote package entry")));
    listResult.append(qMakePair(QString("data/marginNote.marginnotes"), baBinary));
    listResult.append(qMakePair(QString("info.plist"), QByteArray(1000, 'x')));

    return listResult;
}

static qint64 _getCentralDirectoryOffset(const QByteArray &baZip)
{
    // No archive comment, the record is the last 22 bytes
    qint64 nECDOffset = baZip.size() - 22;
    const uchar *pData = (const uchar *)baZip.constData() + nECDOffset + 16;

    return pData[0] | (pData[1] << 8) | (pData[2] << 16) | ((qint64)pData[3] << 24);
}

TEST(XPkgZipTest, StoredEntriesRoundTrip)
{
    QList<QPair<QString, QByteArray>> listFiles = _createFiles();
    QByteArray baZip = TestData::createZip(listFiles, XPkgZip::CMETHOD_STORE);

    XPkgZip pkgZip(baZip);

    ASSERT_TRUE(pkgZip.isValid());

    QList<XPkgZip::RECORD> listRecords = pkgZip.getRecords();
    ASSERT_EQ(listFiles.count(), listRecords.count());

    for (qint32 i = 0; i < listFiles.count(); i++) {
        EXPECT_EQ(listFiles.at(i).first, listRecords.at(i).sFileName);
        EXPECT_EQ((quint16)XPkgZip::CMETHOD_STORE, listRecords.at(i).nMethod);

        QByteArray baData;
        ASSERT_TRUE(pkgZip.decompress(listFiles.at(i).first, &baData));
        EXPECT_EQ(listFiles.at(i).second, baData);
    }
}

TEST(XPkgZipTest, DeflateEntriesRoundTripAtEveryLevel)
{
    QList<QPair<QString, QByteArray>> listFiles = _createFiles();

    for (qint32 nLevel = 0; nLevel <= 9; nLevel++) {
        QByteArray baZip = XPkgZip::createArchive(listFiles, XPkgZip::CMETHOD_DEFLATE, nLevel);

        XPkgZip pkgZip(baZip);

        QList<XPkgZip::RECORD> listRecords = pkgZip.getRecords();
        ASSERT_EQ(listFiles.count(), listRecords.count()) << "level " << nLevel;

        QMap<QString, QByteArray> mapData = pkgZip.decompressRecords(listRecords);
        ASSERT_EQ(listFiles.count(), mapData.count()) << "level " << nLevel;

        for (qint32 i = 0; i < listFiles.count(); i++) {
            EXPECT_EQ((quint16)XPkgZip::CMETHOD_DEFLATE, listRecords.at(i).nMethod);
            EXPECT_EQ(listFiles.at(i).second, mapData.value(listFiles.at(i).first)) << "level " << nLevel;
        }
    }
}

TEST(XPkgZipTest, MissingEndOfCentralDirectoryIsFatal)
{
    QByteArray baData(4096, 'A');

    XPkgZip pkgZip(baData);

    QList<XPkgZip::RECORD> listRecords;

    EXPECT_FALSE(pkgZip.isValid());
    EXPECT_EQ(-1, pkgZip.findECDOffset());
    EXPECT_FALSE(pkgZip.readRecords(&listRecords));
    EXPECT_TRUE(listRecords.isEmpty());
    EXPECT_FALSE(pkgZip.getErrorString().isEmpty());
}

TEST(XPkgZipTest, EndOfCentralDirectoryFoundBehindComment)
{
    QList<XPkgZip::RECORD> listRecords;

    QByteArray baZip;
    QBuffer buffer(&baZip);
    ASSERT_TRUE(buffer.open(QIODevice::WriteOnly));

    XPkgZip::RECORD record = {};
    record.sFileName = "a.db";
    ASSERT_TRUE(XPkgZip::addLocalFileRecord(QByteArray("payload"), &buffer, &record, XPkgZip::CMETHOD_DEFLATE));
    listRecords.append(record);
    ASSERT_TRUE(XPkgZip::addCentralDirectory(&buffer, &listRecords, QString(300, 'c')));
    buffer.close();

    XPkgZip pkgZip(baZip);

    QByteArray baData;
    ASSERT_TRUE(pkgZip.decompress(QString("a.db"), &baData));
    EXPECT_EQ(QByteArray("payload"), baData);
}

TEST(XPkgZipTest, UnsupportedMethodSkipsOnlyThatEntry)
{
    QList<QPair<QString, QByteArray>> listFiles = _createFiles();
    QByteArray baZip = TestData::createZip(listFiles, XPkgZip::CMETHOD_STORE);

    // Method field of the first central directory header
    qint64 nMethodOffset = _getCentralDirectoryOffset(baZip) + offsetof(XPkgZip::CENTRALDIRECTORYFILEHEADER, nMethod);
    baZip[(qint32)nMethodOffset] = 12;

    XPkgZip pkgZip(baZip);

    QList<XPkgZip::RECORD> listRecords;
    ASSERT_TRUE(pkgZip.readRecords(&listRecords));
    ASSERT_EQ(3, listRecords.count());
    EXPECT_EQ(12, listRecords.at(0).nMethod);

    QByteArray baData;
    EXPECT_FALSE(pkgZip.decompress(listRecords.at(0), &baData));
    EXPECT_TRUE(baData.isEmpty());

    QMap<QString, QByteArray> mapData = pkgZip.decompressRecords(listRecords);
    EXPECT_EQ(2, mapData.count());
    EXPECT_FALSE(mapData.contains(listFiles.at(0).first));
    EXPECT_EQ(listFiles.at(1).second, mapData.value(listFiles.at(1).first));
}

TEST(XPkgZipTest, DamagedPayloadFailsChecksum)
{
    QList<QPair<QString, QByteArray>> listFiles = _createFiles();
    QByteArray baZip = TestData::createZip(listFiles, XPkgZip::CMETHOD_STORE);

    XPkgZip pkgZipOriginal(baZip);
    QList<XPkgZip::RECORD> listRecords = pkgZipOriginal.getRecords();
    ASSERT_EQ(3, listRecords.count());

    baZip[(qint32)listRecords.at(0).nDataOffset] = 'Z';

    XPkgZip pkgZip(baZip);

    QByteArray baData;
    EXPECT_FALSE(pkgZip.decompress(listRecords.at(0), &baData));
    EXPECT_TRUE(pkgZip.decompress(listRecords.at(1), &baData));
}

TEST(XPkgZipTest, DamagedLocalHeaderIsFatal)
{
    QByteArray baZip = TestData::createZip(_createFiles(), XPkgZip::CMETHOD_STORE);

    baZip[0] = 'X';

    XPkgZip pkgZip(baZip);

    QList<XPkgZip::RECORD> listRecords;
    EXPECT_FALSE(pkgZip.readRecords(&listRecords));
    EXPECT_TRUE(listRecords.isEmpty());
}

TEST(XPkgZipTest, FindRecordsByPattern)
{
    XPkgZip pkgZip(TestData::createZip(_createFiles(), XPkgZip::CMETHOD_DEFLATE));

    QList<XPkgZip::RECORD> listRecords = pkgZip.findRecords(QRegularExpression("\\.marginnotes$"));

    ASSERT_EQ(1, listRecords.count());
    EXPECT_EQ(QString("data/marginNote.marginnotes"), listRecords.at(0).sFileName);

    XPkgZip::RECORD record = {};
    EXPECT_FALSE(pkgZip.findRecord("missing.db", &record));
}
