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
#include "xkeyedarchiver.h"

#include <QDebug>

XKeyedArchiver::XKeyedArchiver(QObject *parent) : QObject(parent)
{
    g_nCycleCount = 0;
}

void XKeyedArchiver::setOptions(const OPTIONS &options)
{
    g_options = options;
}

XKeyedArchiver::OPTIONS XKeyedArchiver::getOptions() const
{
    return g_options;
}

bool XKeyedArchiver::isKeyedArchive(const XBPList &plist)
{
    bool bResult = false;

    qint32 nTopIndex = plist.getTopIndex();

    if ((nTopIndex >= 0) && (nTopIndex < plist.getObjects().count()) && (plist.getObjects().at(nTopIndex).vt == XBPList::VT_DICT)) {
        qint32 nObjects = _findDictValue(plist, nTopIndex, "$objects");
        qint32 nTop = _findDictValue(plist, nTopIndex, "$top");

        bResult = (_findDictValue(plist, nTopIndex, "$archiver") != -1) && (_findDictValue(plist, nTopIndex, "$version") != -1) && (nObjects != -1) &&
                  (nTop != -1) && (plist.getObjects().at(nObjects).vt == XBPList::VT_ARRAY) && (plist.getObjects().at(nTop).vt == XBPList::VT_DICT);
    }

    return bResult;
}

XKeyedArchiver::DECODE_RESULT XKeyedArchiver::decode(const QByteArray &baData, QVariant *pvarResult)
{
    DECODE_RESULT result = DECODE_RESULT_OK;

    *pvarResult = QVariant();
    g_sErrorString.clear();
    g_nCycleCount = 0;

    if (baData.isEmpty()) {
        result = DECODE_RESULT_EMPTY;
    } else {
        XBPList plist;

        connect(&plist, SIGNAL(warningMessage(QString)), this, SIGNAL(warningMessage(QString)));

        if (!plist.parse(baData)) {
            g_sErrorString = plist.getErrorString();
            result = DECODE_RESULT_PLISTERROR;
        } else if (plist.isDegraded()) {
            *pvarResult = plist.toVariant();
            result = DECODE_RESULT_DEGRADED;
        } else if (!isKeyedArchive(plist)) {
            result = DECODE_RESULT_NOTARCHIVE;
        } else {
            QVariant varResolved = resolve(plist);

            if (g_nCycleCount && g_options.bStrict) {
                g_sErrorString = tr("Cyclic object reference");
                result = DECODE_RESULT_CYCLE;
            } else {
                *pvarResult = varResolved;
            }
        }
    }

    if ((result == DECODE_RESULT_PLISTERROR) || (result == DECODE_RESULT_CYCLE)) {
        if (g_options.bStrict) {
            emit errorMessage(g_sErrorString);
        } else {
            emit warningMessage(g_sErrorString);
        }
    }

    return result;
}

QVariant XKeyedArchiver::resolve(const XBPList &plist)
{
    QVariant varResult;

    g_listArchiveObjects.clear();
    g_listStack.clear();
    g_hashResolved.clear();
    g_nCycleCount = 0;

    if (isKeyedArchive(plist)) {
        qint32 nTopIndex = plist.getTopIndex();

        g_listArchiveObjects = plist.getObjects().at(_findDictValue(plist, nTopIndex, "$objects")).listIndexes;

        qint32 nTop = _findDictValue(plist, nTopIndex, "$top");
        qint32 nRoot = _findDictValue(plist, nTop, "root");

        if (nRoot != -1) {
            varResult = _resolveObject(plist, nRoot, 0);
        }
    }

    return varResult;
}

QVariant XKeyedArchiver::simplify(const QString &sClassName, const QVariantMap &mapFields)
{
    QVariant varResult;

    if ((sClassName == "NSArray") || (sClassName == "NSMutableArray") || (sClassName == "NSSet") || (sClassName == "NSMutableSet")) {
        varResult = mapFields.value("NS.objects").toList();
    } else if ((sClassName == "NSDictionary") || (sClassName == "NSMutableDictionary")) {
        QVariantMap mapResult;
        QVariantList listKeys = mapFields.value("NS.keys").toList();
        QVariantList listObjects = mapFields.value("NS.objects").toList();

        qint32 nNumberOfKeys = qMin(listKeys.count(), listObjects.count());

        for (qint32 i = 0; i < nNumberOfKeys; i++) {
            if (listKeys.at(i).isValid() && listObjects.at(i).isValid()) {
                mapResult.insert(listKeys.at(i).toString(), listObjects.at(i));
            }
        }

        varResult = mapResult;
    } else {
        QVariantMap mapResult;

        for (QVariantMap::const_iterator it = mapFields.constBegin(); it != mapFields.constEnd(); ++it) {
            if ((!it.key().startsWith("$")) && it.value().isValid()) {
                mapResult.insert(it.key(), it.value());
            }
        }

        // Bookkeeping objects vanish
        if (!mapResult.isEmpty()) {
            varResult = mapResult;
        }
    }

    return varResult;
}

qint32 XKeyedArchiver::getCycleCount() const
{
    return g_nCycleCount;
}

QString XKeyedArchiver::getErrorString() const
{
    return g_sErrorString;
}

qint32 XKeyedArchiver::_findDictValue(const XBPList &plist, qint32 nDictIndex, const QString &sKey)
{
    qint32 nResult = -1;

    const QList<XBPList::OBJECT> &listObjects = plist.getObjects();

    if ((nDictIndex >= 0) && (nDictIndex < listObjects.count()) && (listObjects.at(nDictIndex).vt == XBPList::VT_DICT)) {
        const XBPList::OBJECT &object = listObjects.at(nDictIndex);

        qint32 nNumberOfKeys = object.listKeyIndexes.count();

        for (qint32 i = 0; i < nNumberOfKeys; i++) {
            const XBPList::OBJECT &key = listObjects.at(object.listKeyIndexes.at(i));

            if ((key.vt == XBPList::VT_STRING) && (key.varValue.toString() == sKey)) {
                nResult = object.listIndexes.at(i);
                break;
            }
        }
    }

    return nResult;
}

QString XKeyedArchiver::_readClassName(const XBPList &plist, qint32 nIndex) const
{
    QString sResult;

    const QList<XBPList::OBJECT> &listObjects = plist.getObjects();

    if ((nIndex >= 0) && (nIndex < listObjects.count()) && (listObjects.at(nIndex).vt == XBPList::VT_UID)) {
        qint32 nUID = (qint32)listObjects.at(nIndex).varValue.toLongLong();

        if ((nUID >= 0) && (nUID < g_listArchiveObjects.count())) {
            qint32 nClassName = _findDictValue(plist, g_listArchiveObjects.at(nUID), "$classname");

            if ((nClassName != -1) && (listObjects.at(nClassName).vt == XBPList::VT_STRING)) {
                sResult = listObjects.at(nClassName).varValue.toString();
            }
        }
    }

    return sResult;
}

QVariant XKeyedArchiver::_resolveUID(const XBPList &plist, qint32 nUID, qint32 nDepth)
{
    QVariant varResult;

    if ((nUID < 0) || (nUID >= g_listArchiveObjects.count())) {
#ifdef QT_DEBUG
        qDebug() << "XKeyedArchiver: UID out of range" << nUID;
#endif
    } else if (g_listStack.contains(nUID)) {
        // Reference back to an ancestor
        g_nCycleCount++;
    } else if (g_hashResolved.contains(nUID)) {
        varResult = g_hashResolved.value(nUID);
    } else {
        g_listStack.append(nUID);
        varResult = _resolveObject(plist, g_listArchiveObjects.at(nUID), nDepth + 1);
        g_listStack.removeLast();

        // Each UID is resolved once per decode, truncated values included
        g_hashResolved.insert(nUID, varResult);
    }

    return varResult;
}

QVariant XKeyedArchiver::_resolveObject(const XBPList &plist, qint32 nIndex, qint32 nDepth)
{
    QVariant varResult;

    const QList<XBPList::OBJECT> &listObjects = plist.getObjects();

    if (nDepth > g_options.nMaxDepth) {
        g_nCycleCount++;
    } else if ((nIndex >= 0) && (nIndex < listObjects.count())) {
        const XBPList::OBJECT &object = listObjects.at(nIndex);

        if (object.vt == XBPList::VT_UID) {
            varResult = _resolveUID(plist, (qint32)object.varValue.toLongLong(), nDepth);
        } else if (object.vt == XBPList::VT_DICT) {
            QString sClassName;
            QVariantMap mapFields;

            qint32 nNumberOfKeys = object.listKeyIndexes.count();

            for (qint32 i = 0; i < nNumberOfKeys; i++) {
                QString sKey = listObjects.at(object.listKeyIndexes.at(i)).varValue.toString();

                if (sKey == "$class") {
                    sClassName = _readClassName(plist, object.listIndexes.at(i));
                } else {
                    mapFields.insert(sKey, _resolveObject(plist, object.listIndexes.at(i), nDepth + 1));
                }
            }

            varResult = simplify(sClassName, mapFields);
        } else if ((object.vt == XBPList::VT_ARRAY) || (object.vt == XBPList::VT_SET)) {
            QVariantList listResult;

            qint32 nNumberOfElements = object.listIndexes.count();

            for (qint32 i = 0; i < nNumberOfElements; i++) {
                QVariant varItem = _resolveObject(plist, object.listIndexes.at(i), nDepth + 1);

                if (varItem.isValid()) {
                    listResult.append(varItem);
                }
            }

            varResult = listResult;
        } else if ((object.vt == XBPList::VT_STRING) && (object.varValue.toString() == "$null")) {
            varResult = QVariant();
        } else {
            varResult = object.varValue;
        }
    }

    return varResult;
}
