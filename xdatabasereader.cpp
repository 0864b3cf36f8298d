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
#include "xdatabasereader.h"

#include <sqlite3.h>

#include <string.h>

XDatabaseReader::XDatabaseReader(QObject *parent) : QObject(parent)
{
}

bool XDatabaseReader::readNotes(QList<QVariantMap> *pListRows)
{
    bool bResult = false;

    pListRows->clear();

    if (hasTable("ZBOOKNOTE")) {
        bResult = readTable("ZBOOKNOTE", pListRows);
    } else {
        _setError(tr("Table %1 not found").arg("ZBOOKNOTE"));
    }

    return bResult;
}

bool XDatabaseReader::readTopics(QList<QVariantMap> *pListRows)
{
    return _readOptionalTable("ZTOPIC", pListRows);
}

bool XDatabaseReader::readMedia(QList<QVariantMap> *pListRows)
{
    return _readOptionalTable("ZMEDIA", pListRows);
}

QString XDatabaseReader::getErrorString() const
{
    return g_sErrorString;
}

bool XDatabaseReader::_readOptionalTable(const QString &sTableName, QList<QVariantMap> *pListRows)
{
    bool bResult = true;

    pListRows->clear();

    if (hasTable(sTableName)) {
        bResult = readTable(sTableName, pListRows);
    } else {
        emit warningMessage(tr("Table %1 not found").arg(sTableName));
    }

    return bResult;
}

void XDatabaseReader::_setError(const QString &sText)
{
    g_sErrorString = sText;
    emit errorMessage(sText);
}

XSQLiteDatabaseReader::XSQLiteDatabaseReader(QObject *parent) : XDatabaseReader(parent)
{
    g_pDatabase = nullptr;
}

XSQLiteDatabaseReader::~XSQLiteDatabaseReader()
{
    close();
}

bool XSQLiteDatabaseReader::isValid(const QByteArray &baData)
{
    return baData.startsWith(getSignature());
}

QByteArray XSQLiteDatabaseReader::getSignature()
{
    return QByteArray("SQLite format 3\0", 16);
}

bool XSQLiteDatabaseReader::open(const QByteArray &baData)
{
    bool bResult = false;

    close();

    if (!isValid(baData)) {
        _setError(tr("Invalid database"));
        return false;
    }

    if (sqlite3_open_v2(":memory:", &g_pDatabase, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr) == SQLITE_OK) {
        sqlite3_int64 nSize = baData.size();
        unsigned char *pBuffer = (unsigned char *)sqlite3_malloc64(nSize);

        if (pBuffer) {
            memcpy(pBuffer, baData.constData(), nSize);

            // The connection owns the buffer from here, also on failure
            if (sqlite3_deserialize(g_pDatabase, "main", pBuffer, nSize, nSize, SQLITE_DESERIALIZE_FREEONCLOSE | SQLITE_DESERIALIZE_RESIZEABLE) == SQLITE_OK) {
                // Page checks happen on first access
                bResult = (sqlite3_exec(g_pDatabase, "SELECT count(*) FROM sqlite_master", nullptr, nullptr, nullptr) == SQLITE_OK);
            }
        }

        if (!bResult) {
            _setError(tr("Cannot open database: %1").arg(_getLastError()));
        }
    } else {
        _setError(tr("Cannot open database: %1").arg(_getLastError()));
    }

    if (!bResult) {
        close();
    }

    return bResult;
}

void XSQLiteDatabaseReader::close()
{
    if (g_pDatabase) {
        sqlite3_close(g_pDatabase);
        g_pDatabase = nullptr;
    }
}

bool XSQLiteDatabaseReader::isOpen() const
{
    return (g_pDatabase != nullptr);
}

bool XSQLiteDatabaseReader::hasTable(const QString &sTableName)
{
    bool bResult = false;

    if (g_pDatabase) {
        sqlite3_stmt *pStatement = nullptr;

        if (sqlite3_prepare_v2(g_pDatabase, "SELECT name FROM sqlite_master WHERE type='table' AND name=?", -1, &pStatement, nullptr) == SQLITE_OK) {
            QByteArray baName = sTableName.toUtf8();
            sqlite3_bind_text(pStatement, 1, baName.constData(), baName.size(), SQLITE_TRANSIENT);

            bResult = (sqlite3_step(pStatement) == SQLITE_ROW);
        }

        sqlite3_finalize(pStatement);
    }

    return bResult;
}

bool XSQLiteDatabaseReader::readTable(const QString &sTableName, QList<QVariantMap> *pListRows)
{
    bool bResult = false;

    pListRows->clear();

    if (!g_pDatabase) {
        _setError(tr("Database is not open"));
        return false;
    }

    QString sQuery = QString("SELECT * FROM \"%1\"").arg(QString(sTableName).replace("\"", "\"\""));
    QByteArray baQuery = sQuery.toUtf8();

    sqlite3_stmt *pStatement = nullptr;

    if (sqlite3_prepare_v2(g_pDatabase, baQuery.constData(), baQuery.size(), &pStatement, nullptr) == SQLITE_OK) {
        qint32 nNumberOfColumns = sqlite3_column_count(pStatement);

        QStringList listColumns;

        for (qint32 i = 0; i < nNumberOfColumns; i++) {
            listColumns.append(QString::fromUtf8(sqlite3_column_name(pStatement, i)));
        }

        qint32 nStatus = SQLITE_ROW;

        while ((nStatus = sqlite3_step(pStatement)) == SQLITE_ROW) {
            QVariantMap mapRow;

            for (qint32 i = 0; i < nNumberOfColumns; i++) {
                QVariant varValue;

                switch (sqlite3_column_type(pStatement, i)) {
                    case SQLITE_INTEGER: varValue = (qint64)sqlite3_column_int64(pStatement, i); break;
                    case SQLITE_FLOAT: varValue = sqlite3_column_double(pStatement, i); break;
                    case SQLITE_TEXT:
                        varValue = QString::fromUtf8((const char *)sqlite3_column_text(pStatement, i), sqlite3_column_bytes(pStatement, i));
                        break;
                    case SQLITE_BLOB:
                        varValue = QByteArray((const char *)sqlite3_column_blob(pStatement, i), sqlite3_column_bytes(pStatement, i));
                        break;
                    default: break;  // NULL
                }

                mapRow.insert(listColumns.at(i), varValue);
            }

            pListRows->append(mapRow);
        }

        bResult = (nStatus == SQLITE_DONE);
    }

    if (!bResult) {
        _setError(tr("Cannot read table %1: %2").arg(sTableName, _getLastError()));
    }

    sqlite3_finalize(pStatement);

#ifdef QT_DEBUG
    qDebug("%s: %d rows", sTableName.toLatin1().data(), pListRows->count());
#endif

    return bResult;
}

QStringList XSQLiteDatabaseReader::getTableNames()
{
    QStringList listResult;

    if (g_pDatabase) {
        sqlite3_stmt *pStatement = nullptr;

        if (sqlite3_prepare_v2(g_pDatabase, "SELECT name FROM sqlite_master WHERE type='table' ORDER BY name", -1, &pStatement, nullptr) == SQLITE_OK) {
            while (sqlite3_step(pStatement) == SQLITE_ROW) {
                listResult.append(QString::fromUtf8((const char *)sqlite3_column_text(pStatement, 0)));
            }
        }

        sqlite3_finalize(pStatement);
    }

    return listResult;
}

QString XSQLiteDatabaseReader::_getLastError() const
{
    QString sResult;

    if (g_pDatabase) {
        sResult = QString::fromUtf8(sqlite3_errmsg(g_pDatabase));
    }

    return sResult;
}
