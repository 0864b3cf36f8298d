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
#include "testdata.h"

#include <sqlite3.h>

#include <string.h>

struct NODE {
    QVariant varValue;
    bool bIsUID;
    QList<qint32> listKeys;
    QList<qint32> listValues;
};

static bool _isUID(const QVariant &varValue)
{
    return (varValue.userType() == QMetaType::QVariantMap) && (varValue.toMap().count() == 1) && varValue.toMap().contains("CF$UID");
}

static qint32 _addNode(const QVariant &varValue, QList<NODE> *pListNodes)
{
    qint32 nIndex = pListNodes->count();

    NODE node;
    node.varValue = varValue;
    node.bIsUID = _isUID(varValue);
    pListNodes->append(node);

    if (varValue.userType() == QMetaType::QVariantList) {
        QVariantList listValues = varValue.toList();

        for (qint32 i = 0; i < listValues.count(); i++) {
            qint32 nChild = _addNode(listValues.at(i), pListNodes);
            (*pListNodes)[nIndex].listValues.append(nChild);
        }
    } else if ((varValue.userType() == QMetaType::QVariantMap) && (!node.bIsUID)) {
        QVariantMap mapValues = varValue.toMap();

        for (QVariantMap::const_iterator it = mapValues.constBegin(); it != mapValues.constEnd(); ++it) {
            qint32 nKey = _addNode(it.key(), pListNodes);
            qint32 nValue = _addNode(it.value(), pListNodes);
            (*pListNodes)[nIndex].listKeys.append(nKey);
            (*pListNodes)[nIndex].listValues.append(nValue);
        }
    }

    return nIndex;
}

static void _appendBE(QByteArray *pbaData, quint64 nValue, qint32 nSize)
{
    for (qint32 i = nSize - 1; i >= 0; i--) {
        pbaData->append((char)((nValue >> (i * 8)) & 0xFF));
    }
}

static void _appendInt(QByteArray *pbaData, qint64 nValue)
{
    if ((nValue >= 0) && (nValue <= 0xFF)) {
        pbaData->append((char)0x10);
        _appendBE(pbaData, nValue, 1);
    } else if ((nValue >= 0) && (nValue <= 0xFFFF)) {
        pbaData->append((char)0x11);
        _appendBE(pbaData, nValue, 2);
    } else if ((nValue >= 0) && (nValue <= 0xFFFFFFFFLL)) {
        pbaData->append((char)0x12);
        _appendBE(pbaData, nValue, 4);
    } else {
        pbaData->append((char)0x13);
        _appendBE(pbaData, (quint64)nValue, 8);
    }
}

static void _appendMarker(QByteArray *pbaData, quint8 nType, qint64 nLength)
{
    if (nLength < 15) {
        pbaData->append((char)(nType | nLength));
    } else {
        pbaData->append((char)(nType | 0x0F));
        _appendInt(pbaData, nLength);
    }
}

static void _appendDouble(QByteArray *pbaData, quint8 nMarker, double dValue)
{
    quint64 nBits = 0;
    memcpy(&nBits, &dValue, sizeof(nBits));

    pbaData->append((char)nMarker);
    _appendBE(pbaData, nBits, 8);
}

static QByteArray _encodeNode(const NODE &node, qint32 nRefSize)
{
    QByteArray baResult;

    const QVariant &varValue = node.varValue;
    qint32 nType = varValue.userType();

    if (node.bIsUID) {
        qint64 nUID = varValue.toMap().value("CF$UID").toLongLong();

        if (nUID <= 0xFF) {
            baResult.append((char)0x80);
            _appendBE(&baResult, nUID, 1);
        } else {
            baResult.append((char)0x83);
            _appendBE(&baResult, nUID, 4);
        }
    } else if (!varValue.isValid()) {
        baResult.append((char)0x00);
    } else if (nType == QMetaType::Bool) {
        baResult.append(varValue.toBool() ? (char)0x09 : (char)0x08);
    } else if ((nType == QMetaType::Int) || (nType == QMetaType::LongLong) || (nType == QMetaType::UInt) || (nType == QMetaType::ULongLong)) {
        _appendInt(&baResult, varValue.toLongLong());
    } else if (nType == QMetaType::Double) {
        _appendDouble(&baResult, 0x23, varValue.toDouble());
    } else if (nType == QMetaType::QDateTime) {
        double dSeconds = (varValue.toDateTime().toMSecsSinceEpoch() / 1000.0) - 978307200.0;
        _appendDouble(&baResult, 0x33, dSeconds);
    } else if (nType == QMetaType::QByteArray) {
        QByteArray baValue = varValue.toByteArray();
        _appendMarker(&baResult, 0x40, baValue.size());
        baResult.append(baValue);
    } else if (nType == QMetaType::QVariantList) {
        _appendMarker(&baResult, 0xA0, node.listValues.count());

        for (qint32 i = 0; i < node.listValues.count(); i++) {
            _appendBE(&baResult, node.listValues.at(i), nRefSize);
        }
    } else if (nType == QMetaType::QVariantMap) {
        _appendMarker(&baResult, 0xD0, node.listKeys.count());

        for (qint32 i = 0; i < node.listKeys.count(); i++) {
            _appendBE(&baResult, node.listKeys.at(i), nRefSize);
        }

        for (qint32 i = 0; i < node.listValues.count(); i++) {
            _appendBE(&baResult, node.listValues.at(i), nRefSize);
        }
    } else {
        QString sValue = varValue.toString();
        bool bIsAscii = true;

        for (qint32 i = 0; i < sValue.length(); i++) {
            if (sValue.at(i).unicode() >= 0x80) {
                bIsAscii = false;
                break;
            }
        }

        if (bIsAscii) {
            _appendMarker(&baResult, 0x50, sValue.length());
            baResult.append(sValue.toLatin1());
        } else {
            _appendMarker(&baResult, 0x60, sValue.length());

            for (qint32 i = 0; i < sValue.length(); i++) {
                _appendBE(&baResult, sValue.at(i).unicode(), 2);
            }
        }
    }

    return baResult;
}

static QVariant _archiveValue(const QVariant &varValue, QVariantList *pListObjects, QMap<QString, qint32> *pMapClasses)
{
    QVariant varResult;

    qint32 nType = varValue.userType();

    if (!varValue.isValid()) {
        varResult = TestData::uid(0);
    } else if ((nType == QMetaType::Bool) || (nType == QMetaType::Int) || (nType == QMetaType::LongLong) || (nType == QMetaType::Double)) {
        varResult = varValue;
    } else {
        QString sClassName;
        QVariantMap mapObject;

        qint32 nIndex = pListObjects->count();
        pListObjects->append(QVariant());

        if (nType == QMetaType::QVariantList) {
            QVariantList listValues = varValue.toList();
            QVariantList listRefs;

            for (qint32 i = 0; i < listValues.count(); i++) {
                listRefs.append(_archiveValue(listValues.at(i), pListObjects, pMapClasses));
            }

            sClassName = "NSArray";
            mapObject.insert("NS.objects", listRefs);
        } else if (nType == QMetaType::QVariantMap) {
            QVariantMap mapValues = varValue.toMap();

            if (mapValues.contains("$classname")) {
                sClassName = mapValues.value("$classname").toString();
                mapValues.remove("$classname");

                for (QVariantMap::const_iterator it = mapValues.constBegin(); it != mapValues.constEnd(); ++it) {
                    mapObject.insert(it.key(), _archiveValue(it.value(), pListObjects, pMapClasses));
                }
            } else {
                QVariantList listKeys;
                QVariantList listRefs;

                for (QVariantMap::const_iterator it = mapValues.constBegin(); it != mapValues.constEnd(); ++it) {
                    listKeys.append(_archiveValue(it.key(), pListObjects, pMapClasses));
                    listRefs.append(_archiveValue(it.value(), pListObjects, pMapClasses));
                }

                sClassName = "NSDictionary";
                mapObject.insert("NS.keys", listKeys);
                mapObject.insert("NS.objects", listRefs);
            }
        }

        if (sClassName.isEmpty()) {
            // Strings and data are stored directly
            (*pListObjects)[nIndex] = varValue;
        } else {
            if (!pMapClasses->contains(sClassName)) {
                pMapClasses->insert(sClassName, pListObjects->count());
                pListObjects->append(TestData::createClass(sClassName));
            }

            mapObject.insert("$class", TestData::uid(pMapClasses->value(sClassName)));
            (*pListObjects)[nIndex] = mapObject;
        }

        varResult = TestData::uid(nIndex);
    }

    return varResult;
}

static bool _createTable(sqlite3 *pDatabase, const QString &sTableName, const QList<QVariantMap> &listRows)
{
    bool bResult = false;

    QStringList listColumns;

    for (qint32 i = 0; i < listRows.count(); i++) {
        QStringList listKeys = listRows.at(i).keys();

        for (qint32 j = 0; j < listKeys.count(); j++) {
            if (!listColumns.contains(listKeys.at(j))) {
                listColumns.append(listKeys.at(j));
            }
        }
    }

    if (listColumns.isEmpty()) {
        listColumns.append("Z_PK");
    }

    QString sCreate = QString("CREATE TABLE %1 (%2)").arg(sTableName, listColumns.join(", "));

    bResult = (sqlite3_exec(pDatabase, sCreate.toUtf8().constData(), nullptr, nullptr, nullptr) == SQLITE_OK);

    QStringList listPlaceholders;

    for (qint32 i = 0; i < listColumns.count(); i++) {
        listPlaceholders.append("?");
    }

    QByteArray baInsert = QString("INSERT INTO %1 (%2) VALUES (%3)").arg(sTableName, listColumns.join(", "), listPlaceholders.join(", ")).toUtf8();

    for (qint32 i = 0; (i < listRows.count()) && bResult; i++) {
        sqlite3_stmt *pStatement = nullptr;

        if (sqlite3_prepare_v2(pDatabase, baInsert.constData(), -1, &pStatement, nullptr) == SQLITE_OK) {
            for (qint32 j = 0; j < listColumns.count(); j++) {
                QVariant varValue = listRows.at(i).value(listColumns.at(j));
                qint32 nType = varValue.userType();

                if (!varValue.isValid()) {
                    sqlite3_bind_null(pStatement, j + 1);
                } else if (nType == QMetaType::QByteArray) {
                    QByteArray baValue = varValue.toByteArray();
                    sqlite3_bind_blob(pStatement, j + 1, baValue.constData(), baValue.size(), SQLITE_TRANSIENT);
                } else if (nType == QMetaType::Double) {
                    sqlite3_bind_double(pStatement, j + 1, varValue.toDouble());
                } else if ((nType == QMetaType::Int) || (nType == QMetaType::LongLong) || (nType == QMetaType::Bool)) {
                    sqlite3_bind_int64(pStatement, j + 1, varValue.toLongLong());
                } else {
                    QByteArray baValue = varValue.toString().toUtf8();
                    sqlite3_bind_text(pStatement, j + 1, baValue.constData(), baValue.size(), SQLITE_TRANSIENT);
                }
            }

            bResult = (sqlite3_step(pStatement) == SQLITE_DONE);
        } else {
            bResult = false;
        }

        sqlite3_finalize(pStatement);
    }

    return bResult;
}

QVariant TestData::uid(qint32 nUID)
{
    QVariantMap mapResult;
    mapResult.insert("CF$UID", nUID);

    return mapResult;
}

QByteArray TestData::createBPList(const QVariant &varRoot)
{
    QByteArray baResult("bplist00");

    QList<NODE> listNodes;
    _addNode(varRoot, &listNodes);

    qint32 nNumberOfNodes = listNodes.count();
    qint32 nRefSize = (nNumberOfNodes <= 0xFF) ? 1 : 2;

    QList<qint64> listOffsets;

    for (qint32 i = 0; i < nNumberOfNodes; i++) {
        listOffsets.append(baResult.size());
        baResult.append(_encodeNode(listNodes.at(i), nRefSize));
    }

    qint64 nOffsetTableOffset = baResult.size();
    qint32 nOffsetIntSize = (nOffsetTableOffset <= 0xFF) ? 1 : ((nOffsetTableOffset <= 0xFFFF) ? 2 : 4);

    for (qint32 i = 0; i < nNumberOfNodes; i++) {
        _appendBE(&baResult, listOffsets.at(i), nOffsetIntSize);
    }

    baResult.append(QByteArray(6, 0));
    baResult.append((char)nOffsetIntSize);
    baResult.append((char)nRefSize);
    _appendBE(&baResult, nNumberOfNodes, 8);
    _appendBE(&baResult, 0, 8);
    _appendBE(&baResult, nOffsetTableOffset, 8);

    return baResult;
}

QByteArray TestData::createKeyedArchive(const QVariantList &listObjects, qint32 nRootUID)
{
    QVariantMap mapTop;
    mapTop.insert("root", uid(nRootUID));

    QVariantMap mapArchive;
    mapArchive.insert("$archiver", "NSKeyedArchiver");
    mapArchive.insert("$version", 100000);
    mapArchive.insert("$objects", listObjects);
    mapArchive.insert("$top", mapTop);

    return createBPList(mapArchive);
}

QVariantMap TestData::createClass(const QString &sClassName)
{
    QVariantMap mapResult;
    mapResult.insert("$classname", sClassName);
    mapResult.insert("$classes", QVariantList() << sClassName << "NSObject");

    return mapResult;
}

QByteArray TestData::archive(const QVariant &varRoot)
{
    QVariantList listObjects;
    listObjects.append("$null");

    QMap<QString, qint32> mapClasses;
    QVariant varRootRef = _archiveValue(varRoot, &listObjects, &mapClasses);

    return createKeyedArchive(listObjects, varRootRef.toMap().value("CF$UID").toInt());
}

QByteArray TestData::createLinkNotes(const QList<QPair<QString, QString>> &listLinks)
{
    QVariantList listEntries;

    for (qint32 i = 0; i < listLinks.count(); i++) {
        QVariantMap mapEntry;
        mapEntry.insert("$classname", "MbBookNoteComment");
        mapEntry.insert("type", "LinkNote");
        mapEntry.insert("noteid", listLinks.at(i).first);
        mapEntry.insert("q_htext", listLinks.at(i).second);

        listEntries.append(mapEntry);
    }

    return archive(listEntries);
}

QByteArray TestData::createHighlights(const QString &sText, const QString &sCoordsHash, qint32 nPageNo, const QString &sRect)
{
    QVariantMap mapSelection;
    mapSelection.insert("$classname", "TextSelection");
    mapSelection.insert("pageNo", nPageNo);
    mapSelection.insert("rect", sRect);

    QVariantMap mapHighlight;
    mapHighlight.insert("$classname", "Highlight");
    mapHighlight.insert("highlight_text", sText);
    mapHighlight.insert("coords_hash", sCoordsHash);
    mapHighlight.insert("textSelLst", QVariantList() << mapSelection);

    return archive(QVariantList() << mapHighlight);
}

QByteArray TestData::createTopicOwner(const QString &sMarker)
{
    QVariantMap mapOwner;
    mapOwner.insert("$classname", "MbTopicOwner");
    mapOwner.insert("ownerId", "owner");

    if (!sMarker.isEmpty()) {
        mapOwner.insert(sMarker, true);
    }

    return archive(mapOwner);
}

QByteArray TestData::createZip(const QList<QPair<QString, QByteArray>> &listFiles, XPkgZip::CMETHOD method)
{
    return XPkgZip::createArchive(listFiles, method);
}

QByteArray TestData::createDatabase(const QList<QVariantMap> &listNotes, const QList<QVariantMap> &listTopics, const QList<QVariantMap> &listMedia,
                                    bool bNotesTable)
{
    QByteArray baResult;

    sqlite3 *pDatabase = nullptr;

    if (sqlite3_open_v2(":memory:", &pDatabase, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr) == SQLITE_OK) {
        bool bSuccess = true;

        if (bNotesTable) {
            bSuccess = _createTable(pDatabase, "ZBOOKNOTE", listNotes);
        }

        if (bSuccess && (!listTopics.isEmpty())) {
            bSuccess = _createTable(pDatabase, "ZTOPIC", listTopics);
        }

        if (bSuccess && (!listMedia.isEmpty())) {
            bSuccess = _createTable(pDatabase, "ZMEDIA", listMedia);
        }

        if (bSuccess) {
            sqlite3_int64 nSize = 0;
            unsigned char *pData = sqlite3_serialize(pDatabase, "main", &nSize, 0);

            if (pData) {
                baResult = QByteArray((const char *)pData, (qint32)nSize);
                sqlite3_free(pData);
            }
        }
    }

    sqlite3_close(pDatabase);

    return baResult;
}

QVariantMap TestData::createNoteRow(const QString &sNoteId, const QString &sExcerpt, const QString &sNotes, const QString &sGroupNoteId)
{
    QVariantMap mapResult;
    mapResult.insert("ZNOTEID", sNoteId);
    mapResult.insert("ZHIGHLIGHT_TEXT", sExcerpt);
    mapResult.insert("ZNOTES_TEXT", sNotes);
    mapResult.insert("ZGROUPNOTEID", sGroupNoteId);

    return mapResult;
}
