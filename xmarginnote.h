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
#ifndef XMARGINNOTE_H
#define XMARGINNOTE_H

#include <QByteArray>
#include <QDateTime>
#include <QHash>
#include <QList>
#include <QString>
#include <QStringList>
#include <QVariant>

class XMarginNote {
public:
    enum TOPICTYPE {
        TOPICTYPE_UNKNOWN = 0,
        TOPICTYPE_PROJECT,
        TOPICTYPE_BOOK,
        TOPICTYPE_REVIEWTOPIC,
        TOPICTYPE_GENERAL
    };

    enum MEDIATYPE {
        MEDIATYPE_UNKNOWN = 0,
        MEDIATYPE_IMAGE,
        MEDIATYPE_INK,
        MEDIATYPE_COORDINATES,
        MEDIATYPE_BINARY
    };

    enum TEXTFORMAT {
        TEXTFORMAT_NONE = 0,
        TEXTFORMAT_PLAIN,
        TEXTFORMAT_LIST
    };

    enum ERRORTYPE {
        ERRORTYPE_NONE = 0,
        ERRORTYPE_CONTAINERFORMAT,
        ERRORTYPE_ENTRYEXTRACTION,
        ERRORTYPE_PLISTDECODE,
        ERRORTYPE_ARCHIVERVALIDATION,
        ERRORTYPE_ROWMAPPING,
        ERRORTYPE_GROUPINGINVARIANT,
        ERRORTYPE_DATABASE
    };

    struct RECT {
        double dX;
        double dY;
        double dWidth;
        double dHeight;
    };

    struct EXCERPTREGION {
        bool bIsValid;
        qint32 nPageNo;
        RECT rect;
    };

    struct TEXTSELECTION {
        qint32 nPageNo;
        bool bHasRect;
        RECT rect;
        QString sText;
    };

    struct HIGHLIGHT {
        QString sText;
        QString sCoordsHash;
        QList<TEXTSELECTION> listSelections;
    };

    struct LINKEDNOTE {
        QString sNoteId;
        QString sLinkText;
    };

    struct MEDIAATTACHMENT {
        QString sMediaHash;
        MEDIATYPE mediaType;
    };

    struct NOTERECORD {
        QString sNoteId;
        QString sTopicId;
        QString sGroupNoteId;  // Non-empty for merged variants
        QString sExternalId;
        QString sExcerptText;
        QString sNotesText;
        QString sNoteTitle;
        QString sAuthor;
        qint32 nStartPage;
        qint32 nEndPage;
        QDateTime dtNoteDate;
        QDateTime dtHighlightDate;
        QStringList listHashtags;
        QStringList listLinks;
        QStringList listOtherText;
        QString sFormattedText;
        TEXTFORMAT textFormat;
        QList<LINKEDNOTE> listLinkedNotes;
        QStringList listChildNoteIds;
        QList<HIGHLIGHT> listHighlights;
        QList<MEDIAATTACHMENT> listMedia;
        EXCERPTREGION excerptRegion;
        QVariant varNotesData;
        QVariant varHighlightsData;
        qint32 nWordCount;
        QString sLanguage;
    };

    struct TOPICRECORD {
        QString sTopicId;
        QString sTitle;
        QString sParentTopicId;
        TOPICTYPE topicType;
        QDateTime dtCreateDate;
        QDateTime dtModifyDate;
    };

    struct MEDIARECORD {
        QString sMediaHash;
        MEDIATYPE mediaType;
        QByteArray baData;
        QByteArray baImage;    // MEDIATYPE_IMAGE
        bool bHasStrokes;      // MEDIATYPE_INK
        QString sTextSample;   // MEDIATYPE_COORDINATES
    };

    struct CONTENTGROUP {
        QString sMasterNoteId;
        QStringList listNoteIds;
        QList<NOTERECORD> listNotes;
        NOTERECORD masterNote;
        TOPICTYPE groupType;
    };

    struct STATS {
        qint32 nNoteRows;
        qint32 nNotesMapped;
        qint32 nNotesSkipped;
        qint32 nTopicsMapped;
        qint32 nTopicsSkipped;
        qint32 nMediaMapped;
        qint32 nMediaSkipped;
        qint32 nDecodeWarnings;
        qint32 nGroups;
        qint32 nGroupedNotes;
        qint32 nOutputRecords;
        qint32 nDroppedGroups;
        qint32 nDuplicatesRemoved;
    };

    typedef QHash<QString, TOPICRECORD> TOPICMAP;
    typedef QHash<QString, MEDIARECORD> MEDIAMAP;

    static bool isMerged(const NOTERECORD &noteRecord);
    static bool isOriginal(const NOTERECORD &noteRecord);
    static bool hasContent(const NOTERECORD &noteRecord);
    static QString getAllText(const NOTERECORD &noteRecord);

    static QString topicTypeToString(TOPICTYPE topicType);
    static QString mediaTypeToString(MEDIATYPE mediaType);
    static QString textFormatToString(TEXTFORMAT textFormat);
    static QString errorTypeToString(ERRORTYPE errorType);
};

#endif  // XMARGINNOTE_H
