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
#ifndef XDATABASEREADER_H
#define XDATABASEREADER_H

#include <QObject>
#include <QVariant>

struct sqlite3;

class XDatabaseReader : public QObject {
    Q_OBJECT

public:
    explicit XDatabaseReader(QObject *parent = nullptr);

    virtual bool open(const QByteArray &baData) = 0;
    virtual void close() = 0;
    virtual bool isOpen() const = 0;
    virtual bool hasTable(const QString &sTableName) = 0;
    virtual bool readTable(const QString &sTableName, QList<QVariantMap> *pListRows) = 0;

    bool readNotes(QList<QVariantMap> *pListRows);
    bool readTopics(QList<QVariantMap> *pListRows);
    bool readMedia(QList<QVariantMap> *pListRows);

    QString getErrorString() const;

protected:
    bool _readOptionalTable(const QString &sTableName, QList<QVariantMap> *pListRows);
    void _setError(const QString &sText);

signals:
    void errorMessage(const QString &sText);
    void warningMessage(const QString &sText);

private:
    QString g_sErrorString;
};

class XSQLiteDatabaseReader : public XDatabaseReader {
    Q_OBJECT

public:
    explicit XSQLiteDatabaseReader(QObject *parent = nullptr);
    ~XSQLiteDatabaseReader();

    static bool isValid(const QByteArray &baData);
    static QByteArray getSignature();

    virtual bool open(const QByteArray &baData);
    virtual void close();
    virtual bool isOpen() const;
    virtual bool hasTable(const QString &sTableName);
    virtual bool readTable(const QString &sTableName, QList<QVariantMap> *pListRows);

    QStringList getTableNames();

private:
    QString _getLastError() const;

private:
    sqlite3 *g_pDatabase;
};

#endif  // XDATABASEREADER_H
