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

#include "xtextprocessor.h"

TEST(XTextProcessorTest, HashtagLinesAndInlineTags)
{
    QString sText = QString::fromUtf8("#Example\nsome text\n\xEF\xBC\x83OnlyDue");

    EXPECT_EQ(QStringList() << "Example"
                            << "OnlyDue",
              XTextProcessor::extractHashtags(sText));

    EXPECT_EQ(QStringList() << "alpha"
                            << "beta",
              XTextProcessor::extractHashtags("read #alpha and #beta then #alpha again"));
    EXPECT_EQ(QStringList() << "two words", XTextProcessor::extractHashtags("#two words"));
    EXPECT_TRUE(XTextProcessor::extractHashtags("no tags here").isEmpty());
}

TEST(XTextProcessorTest, NoteLinks)
{
    XTextProcessor textProcessor;

    EXPECT_EQ(QStringList() << "ABC123", textProcessor.extractLinks("see marginnote4app://note/ABC123 for details"));
    EXPECT_EQ(QStringList() << "B-2"
                            << "C3",
              textProcessor.extractLinks("marginnote4app://note/B-2\nand marginnote4app://note/C3 marginnote4app://note/B-2"));
    EXPECT_TRUE(textProcessor.extractLinks("marginnote3app://note/OLD").isEmpty());
}

TEST(XTextProcessorTest, LinkScheme)
{
    XTextProcessor textProcessor("marginnote3app");

    EXPECT_EQ(QString("marginnote3app://note/"), textProcessor.getLinkPrefix());
    EXPECT_EQ(QString("marginnote3app://note/N1"), textProcessor.createLink("N1"));
    EXPECT_EQ(QStringList() << "OLD", textProcessor.extractLinks("marginnote3app://note/OLD"));
}

TEST(XTextProcessorTest, OtherTextSkipsTagsAndLinks)
{
    XTextProcessor textProcessor;

    QStringList listResult = textProcessor.extractOtherText("#tag\nplain line\nmarginnote4app://note/X\n\nmore");

    EXPECT_EQ(QStringList() << "plain line"
                            << "more",
              listResult);
}

TEST(XTextProcessorTest, ListDetection)
{
    EXPECT_TRUE(XTextProcessor::isList(QStringList() << "1. first"
                                                     << "2. second"));
    EXPECT_TRUE(XTextProcessor::isList(QStringList() << "- one"
                                                     << "- two"
                                                     << "closing remark"));
    EXPECT_FALSE(XTextProcessor::isList(QStringList() << "hello"
                                                      << "world"));
    EXPECT_FALSE(XTextProcessor::isList(QStringList() << "1. alone"));
}

TEST(XTextProcessorTest, FormatText)
{
    XMarginNote::TEXTFORMAT textFormat = XMarginNote::TEXTFORMAT_NONE;

    EXPECT_EQ(QString("first second"), XTextProcessor::formatText(QStringList() << " first "
                                                                               << "second",
                                                                 &textFormat));
    EXPECT_EQ(XMarginNote::TEXTFORMAT_PLAIN, textFormat);

    EXPECT_EQ(QString("1. a\n2. b"), XTextProcessor::formatText(QStringList() << "1. a"
                                                                             << "2. b",
                                                               &textFormat));
    EXPECT_EQ(XMarginNote::TEXTFORMAT_LIST, textFormat);

    EXPECT_TRUE(XTextProcessor::formatText(QStringList(), &textFormat).isEmpty());
    EXPECT_EQ(XMarginNote::TEXTFORMAT_NONE, textFormat);
}

TEST(XTextProcessorTest, WordCount)
{
    EXPECT_EQ(2, XTextProcessor::countWords("hello world"));
    EXPECT_EQ(4, XTextProcessor::countWords(QString::fromUtf8("hello world \xE6\x97\xA5\xE6\x9C\xAC")));
    EXPECT_EQ(0, XTextProcessor::countWords(""));
}

TEST(XTextProcessorTest, LanguageDetection)
{
    EXPECT_EQ(QString("en"), XTextProcessor::detectLanguage("hello world"));
    EXPECT_EQ(QString("zh"), XTextProcessor::detectLanguage(QString::fromUtf8("\xE6\x97\xA5\xE6\x9C\xAC\xE8\xAA\x9E\xE3\x81\xA7\xE3\x81\x99")));
    EXPECT_EQ(QString("ja"), XTextProcessor::detectLanguage(QString::fromUtf8("\xE3\x81\xB2\xE3\x82\x89\xE3\x81\x8C\xE3\x81\xAA")));
    EXPECT_EQ(QString("ko"), XTextProcessor::detectLanguage(QString::fromUtf8("\xED\x95\x9C\xEA\xB5\xAD\xEC\x96\xB4")));
    EXPECT_EQ(QString("mixed"), XTextProcessor::detectLanguage(QString::fromUtf8("ab \xE6\x97\xA5\xE6\x9C\xAC")));
    EXPECT_EQ(QString("unknown"), XTextProcessor::detectLanguage("12345"));
    EXPECT_EQ(QString("unknown"), XTextProcessor::detectLanguage("   "));
}

TEST(XTextProcessorTest, RemoveDuplicatesKeepsFirstOccurrence)
{
    EXPECT_EQ(QStringList() << "b"
                            << "a"
                            << "c",
              XTextProcessor::removeDuplicates(QStringList() << "b"
                                                             << "a"
                                                             << "b"
                                                             << "c"
                                                             << "a"));
}
