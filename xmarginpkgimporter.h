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
#ifndef XMARGINPKGIMPORTER_H
#define XMARGINPKGIMPORTER_H

#include "xcontentdeduplicator.h"
#include "xcontentgrouper.h"
#include "xdatabasereader.h"
#include "xnoterecordmapper.h"
#include "xpkgzip.h"

#include <QIODevice>

class XMarginPkgImporter : public QObject {
    Q_OBJECT

public:
    struct OPTIONS {
        bool bStrictDecoding;
        QString sLinkScheme;
        double dReductionThreshold;
        QStringList listDatabasePatterns;  // Regular expressions, case insensitive
        qint32 nMaxResolveDepth;

        OPTIONS()
        {
            bStrictDecoding = false;
            sLinkScheme = "marginnote4app";
            dReductionThreshold = 0.9;
            listDatabasePatterns << "\\.marginnotes$"
                                 << "\\.db$"
                                 << "\\.sqlite$"
                                 << "marginNote";
            nMaxResolveDepth = 512;
        }
    };

    struct IMPORT_RESULT {
        bool bSuccess;
        XMarginNote::ERRORTYPE errorType;
        QString sErrorString;
        QString sDatabaseName;
        QList<XMarginNote::CONTENTGROUP> listGroups;
        XMarginNote::TOPICMAP mapTopics;
        XMarginNote::MEDIAMAP mapMedia;
        XMarginNote::STATS stats;
        XContentDeduplicator::DEDUP_STATISTICS dedupStatistics;
        XContentDeduplicator::VALIDATION_REPORT validation;
    };

    explicit XMarginPkgImporter(QObject *parent = nullptr);

    void setOptions(const OPTIONS &options);
    OPTIONS getOptions() const;

    IMPORT_RESULT importFromData(const QByteArray &baData);
    IMPORT_RESULT importFromDevice(QIODevice *pDevice);
    IMPORT_RESULT importFromDatabase(const QByteArray &baDatabase);
    IMPORT_RESULT importFromRows(const QList<QVariantMap> &listNoteRows, const QList<QVariantMap> &listTopicRows, const QList<QVariantMap> &listMediaRows);

    static bool selectDatabaseRecord(const QList<XPkgZip::RECORD> &listRecords, const QStringList &listPatterns, XPkgZip::RECORD *pRecord);

private:
    static IMPORT_RESULT _createResult();
    void _fail(IMPORT_RESULT *pResult, XMarginNote::ERRORTYPE errorType, const QString &sText);

signals:
    void errorMessage(const QString &sText);
    void warningMessage(const QString &sText);

private:
    OPTIONS g_options;
};

#endif  // XMARGINPKGIMPORTER_H
