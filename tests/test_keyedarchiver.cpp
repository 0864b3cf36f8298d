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

#include <QElapsedTimer>

#include "testdata.h"
#include "xkeyedarchiver.h"

TEST(XKeyedArchiverTest, ArraysAndDictionariesBecomePlainValues)
{
    QVariantMap mapInner;
    mapInner.insert("key", QString("value"));

    QVariantList listRoot;
    listRoot << QString("text") << 5 << mapInner;

    XKeyedArchiver archiver;
    QVariant varResult;

    ASSERT_EQ(XKeyedArchiver::DECODE_RESULT_OK, archiver.decode(TestData::archive(listRoot), &varResult));
    EXPECT_EQ(0, archiver.getCycleCount());

    QVariantList listResult = varResult.toList();

    ASSERT_EQ(3, listResult.count());
    EXPECT_EQ(QString("text"), listResult.at(0).toString());
    EXPECT_EQ(5, listResult.at(1).toLongLong());
    EXPECT_EQ(QString("value"), listResult.at(2).toMap().value("key").toString());
}

TEST(XKeyedArchiverTest, CustomClassKeepsItsFields)
{
    QVariantMap mapHighlight;
    mapHighlight.insert("$classname", "Highlight");
    mapHighlight.insert("highlight_text", QString("abc"));
    mapHighlight.insert("pageNo", 3);

    XKeyedArchiver archiver;
    QVariant varResult;

    ASSERT_EQ(XKeyedArchiver::DECODE_RESULT_OK, archiver.decode(TestData::archive(mapHighlight), &varResult));

    QVariantMap mapResult = varResult.toMap();

    EXPECT_EQ(2, mapResult.count());
    EXPECT_EQ(QString("abc"), mapResult.value("highlight_text").toString());
    EXPECT_EQ(3, mapResult.value("pageNo").toLongLong());
    EXPECT_FALSE(mapResult.contains("$class"));
}

TEST(XKeyedArchiverTest, NullReferencesAreDropped)
{
    QVariantList listRoot;
    listRoot << QVariant() << QString("kept");

    XKeyedArchiver archiver;
    QVariant varResult;

    ASSERT_EQ(XKeyedArchiver::DECODE_RESULT_OK, archiver.decode(TestData::archive(listRoot), &varResult));
    EXPECT_EQ(QVariantList() << QString("kept"), varResult.toList());
}

TEST(XKeyedArchiverTest, SimplifyCollapsesCollectionClasses)
{
    QVariantMap mapArray;
    mapArray.insert("NS.objects", QVariantList() << QString("a") << QString("b"));

    EXPECT_EQ(QVariantList() << QString("a") << QString("b"), XKeyedArchiver::simplify("NSMutableArray", mapArray).toList());

    QVariantMap mapDictionary;
    mapDictionary.insert("NS.keys", QVariantList() << QString("k1") << QString("k2"));
    mapDictionary.insert("NS.objects", QVariantList() << 1 << QVariant());

    QVariantMap mapResult = XKeyedArchiver::simplify("NSDictionary", mapDictionary).toMap();

    EXPECT_EQ(1, mapResult.count());
    EXPECT_EQ(1, mapResult.value("k1").toInt());

    QVariantMap mapBookkeeping;
    mapBookkeeping.insert("$classname", QString("MbBookNote"));

    EXPECT_FALSE(XKeyedArchiver::simplify("", mapBookkeeping).isValid());
}

TEST(XKeyedArchiverTest, EmptyInput)
{
    XKeyedArchiver archiver;
    QVariant varResult;

    EXPECT_EQ(XKeyedArchiver::DECODE_RESULT_EMPTY, archiver.decode(QByteArray(), &varResult));
    EXPECT_FALSE(varResult.isValid());
}

TEST(XKeyedArchiverTest, PlainPropertyListIsNotAnArchive)
{
    QVariantMap mapRoot;
    mapRoot.insert("a", 1);

    XKeyedArchiver archiver;
    QVariant varResult;

    EXPECT_EQ(XKeyedArchiver::DECODE_RESULT_NOTARCHIVE, archiver.decode(TestData::createBPList(mapRoot), &varResult));
    EXPECT_FALSE(varResult.isValid());
}

TEST(XKeyedArchiverTest, GarbageIsAPropertyListError)
{
    XKeyedArchiver archiver;
    QVariant varResult;

    EXPECT_EQ(XKeyedArchiver::DECODE_RESULT_PLISTERROR, archiver.decode(QByteArray("definitely not a property list"), &varResult));
    EXPECT_FALSE(archiver.getErrorString().isEmpty());
}

TEST(XKeyedArchiverTest, DamagedArchiveIsDegraded)
{
    QByteArray baData = TestData::archive(QVariantList() << QString("recoverable text"));

    for (qint32 i = 0; i < 8; i++) {
        baData[baData.size() - 8 + i] = (char)0x7F;
    }

    XKeyedArchiver archiver;
    QVariant varResult;

    ASSERT_EQ(XKeyedArchiver::DECODE_RESULT_DEGRADED, archiver.decode(baData, &varResult));
    EXPECT_TRUE(varResult.toList().contains(QString("recoverable text")));
}

static QByteArray _createSelfReferencingArchive()
{
    QVariantMap mapArray;
    mapArray.insert("$class", TestData::uid(2));
    mapArray.insert("NS.objects", QVariantList() << TestData::uid(1));

    QVariantList listObjects;
    listObjects << QString("$null") << mapArray << TestData::createClass("NSArray");

    return TestData::createKeyedArchive(listObjects, 1);
}

TEST(XKeyedArchiverTest, CycleIsCutInLenientMode)
{
    XKeyedArchiver archiver;
    QVariant varResult;

    ASSERT_EQ(XKeyedArchiver::DECODE_RESULT_OK, archiver.decode(_createSelfReferencingArchive(), &varResult));
    EXPECT_EQ(1, archiver.getCycleCount());
    EXPECT_TRUE(varResult.toList().isEmpty());
}

TEST(XKeyedArchiverTest, CycleFailsInStrictMode)
{
    XKeyedArchiver::OPTIONS options;
    options.bStrict = true;

    XKeyedArchiver archiver;
    archiver.setOptions(options);

    QVariant varResult;

    EXPECT_EQ(XKeyedArchiver::DECODE_RESULT_CYCLE, archiver.decode(_createSelfReferencingArchive(), &varResult));
    EXPECT_FALSE(varResult.isValid());
    EXPECT_FALSE(archiver.getErrorString().isEmpty());
}

TEST(XKeyedArchiverTest, DepthLimitCountsAsCycle)
{
    QVariantList listRoot;
    listRoot << (QVariantList() << (QVariantList() << QString("deep")));

    XKeyedArchiver::OPTIONS options;
    options.nMaxDepth = 2;

    XKeyedArchiver archiver;
    archiver.setOptions(options);

    QVariant varResult;

    EXPECT_EQ(XKeyedArchiver::DECODE_RESULT_OK, archiver.decode(TestData::archive(listRoot), &varResult));
    EXPECT_GT(archiver.getCycleCount(), 0);
}

TEST(XKeyedArchiverTest, DecodingTwiceGivesEqualValues)
{
    QVariantMap mapRoot;
    mapRoot.insert("$classname", "MbBookNote");
    mapRoot.insert("noteid", QString("N1"));
    mapRoot.insert("texts", QVariantList() << QString("one") << QString("two"));

    QByteArray baData = TestData::archive(mapRoot);

    XKeyedArchiver archiver;
    QVariant varResult1;
    QVariant varResult2;

    ASSERT_EQ(XKeyedArchiver::DECODE_RESULT_OK, archiver.decode(baData, &varResult1));
    ASSERT_EQ(XKeyedArchiver::DECODE_RESULT_OK, archiver.decode(baData, &varResult2));

    EXPECT_EQ(varResult1, varResult2);
}

TEST(XKeyedArchiverTest, SharedReferencesBehindACycleResolveOnce)
{
    // $objects[k] = [k + 1, k + 1], the last one points back to the root
    const qint32 nChainLength = 40;

    QVariantList listObjects;
    listObjects << QString("$null");

    for (qint32 k = 1; k < nChainLength; k++) {
        listObjects << QVariant(QVariantList() << TestData::uid(k + 1) << TestData::uid(k + 1));
    }

    listObjects << QVariant(QVariantList() << TestData::uid(1));

    QByteArray baData = TestData::createKeyedArchive(listObjects, 1);

    XKeyedArchiver archiver;
    QVariant varResult;

    QElapsedTimer timer;
    timer.start();

    ASSERT_EQ(XKeyedArchiver::DECODE_RESULT_OK, archiver.decode(baData, &varResult));

    EXPECT_LT(timer.elapsed(), 5000);
    EXPECT_EQ(1, archiver.getCycleCount());
    EXPECT_EQ(2, varResult.toList().count());

    XKeyedArchiver::OPTIONS options;
    options.bStrict = true;
    archiver.setOptions(options);

    EXPECT_EQ(XKeyedArchiver::DECODE_RESULT_CYCLE, archiver.decode(baData, &varResult));
}
