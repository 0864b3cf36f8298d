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
#include "xmarginpkgimporter.h"

#include <QRegularExpression>

XMarginPkgImporter::XMarginPkgImporter(QObject *parent) : QObject(parent)
{
}

void XMarginPkgImporter::setOptions(const OPTIONS &options)
{
    g_options = options;
}

XMarginPkgImporter::OPTIONS XMarginPkgImporter::getOptions() const
{
    return g_options;
}

XMarginPkgImporter::IMPORT_RESULT XMarginPkgImporter::importFromData(const QByteArray &baData)
{
    IMPORT_RESULT result = _createResult();

    XPkgZip pkgZip(baData);

    connect(&pkgZip, SIGNAL(warningMessage(QString)), this, SIGNAL(warningMessage(QString)));

    QList<XPkgZip::RECORD> listRecords;

    if (!pkgZip.readRecords(&listRecords)) {
        _fail(&result, XMarginNote::ERRORTYPE_CONTAINERFORMAT, pkgZip.getErrorString());
        return result;
    }

    XPkgZip::RECORD record = {};

    if (!selectDatabaseRecord(listRecords, g_options.listDatabasePatterns, &record)) {
        _fail(&result, XMarginNote::ERRORTYPE_CONTAINERFORMAT, tr("No database in package"));
        return result;
    }

#ifdef QT_DEBUG
    qDebug("Database entry: %s", record.sFileName.toUtf8().data());
#endif

    QByteArray baDatabase;

    if (!pkgZip.decompress(record, &baDatabase)) {
        _fail(&result, XMarginNote::ERRORTYPE_ENTRYEXTRACTION, QString("%1: %2").arg(tr("Cannot extract database"), record.sFileName));
        return result;
    }

    result = importFromDatabase(baDatabase);
    result.sDatabaseName = record.sFileName;

    return result;
}

XMarginPkgImporter::IMPORT_RESULT XMarginPkgImporter::importFromDevice(QIODevice *pDevice)
{
    IMPORT_RESULT result = _createResult();

    if (pDevice && pDevice->isReadable()) {
        if (!pDevice->isSequential()) {
            pDevice->seek(0);
        }

        result = importFromData(pDevice->readAll());
    } else {
        _fail(&result, XMarginNote::ERRORTYPE_CONTAINERFORMAT, tr("Cannot read device"));
    }

    return result;
}

XMarginPkgImporter::IMPORT_RESULT XMarginPkgImporter::importFromDatabase(const QByteArray &baDatabase)
{
    IMPORT_RESULT result = _createResult();

    XSQLiteDatabaseReader databaseReader;

    connect(&databaseReader, SIGNAL(warningMessage(QString)), this, SIGNAL(warningMessage(QString)));

    QList<QVariantMap> listNoteRows;
    QList<QVariantMap> listTopicRows;
    QList<QVariantMap> listMediaRows;

    if (databaseReader.open(baDatabase) && databaseReader.readNotes(&listNoteRows) && databaseReader.readTopics(&listTopicRows) &&
        databaseReader.readMedia(&listMediaRows)) {
        result = importFromRows(listNoteRows, listTopicRows, listMediaRows);
    } else {
        _fail(&result, XMarginNote::ERRORTYPE_DATABASE, databaseReader.getErrorString());
    }

    return result;
}

XMarginPkgImporter::IMPORT_RESULT XMarginPkgImporter::importFromRows(const QList<QVariantMap> &listNoteRows, const QList<QVariantMap> &listTopicRows,
                                                                      const QList<QVariantMap> &listMediaRows)
{
    IMPORT_RESULT result = _createResult();

    result.stats.nNoteRows = listNoteRows.count();

    XNoteRecordMapper::OPTIONS mapperOptions;
    mapperOptions.bStrictDecoding = g_options.bStrictDecoding;
    mapperOptions.sLinkScheme = g_options.sLinkScheme;
    mapperOptions.nMaxResolveDepth = g_options.nMaxResolveDepth;

    XNoteRecordMapper recordMapper;
    recordMapper.setOptions(mapperOptions);

    connect(&recordMapper, SIGNAL(errorMessage(QString)), this, SIGNAL(errorMessage(QString)));
    connect(&recordMapper, SIGNAL(warningMessage(QString)), this, SIGNAL(warningMessage(QString)));

    // Lookups first, notes reference them
    result.mapMedia = recordMapper.mapMediaRows(listMediaRows);
    result.mapTopics = recordMapper.mapTopics(listTopicRows);

    QList<XMarginNote::NOTERECORD> listNotes;

    if (!recordMapper.isStrictFailure()) {
        listNotes = recordMapper.mapNotes(listNoteRows, result.mapMedia);
    }

    XNoteRecordMapper::COUNTERS counters = recordMapper.getCounters();

    result.stats.nNotesMapped = counters.nNotesMapped;
    result.stats.nNotesSkipped = counters.nNotesSkipped;
    result.stats.nTopicsMapped = counters.nTopicsMapped;
    result.stats.nTopicsSkipped = counters.nTopicsSkipped;
    result.stats.nMediaMapped = counters.nMediaMapped;
    result.stats.nMediaSkipped = counters.nMediaSkipped;
    result.stats.nDecodeWarnings = counters.nDecodeWarnings;

    if (recordMapper.isStrictFailure()) {
        _fail(&result, XMarginNote::ERRORTYPE_PLISTDECODE, recordMapper.getErrorString());
        return result;
    }

    XContentGrouper contentGrouper;

    QList<XMarginNote::CONTENTGROUP> listGroups = contentGrouper.createGroups(listNotes, result.mapTopics);

    XContentGrouper::STATISTICS groupStatistics = contentGrouper.getStatistics();

    result.stats.nGroups = groupStatistics.nNumberOfGroups;
    result.stats.nGroupedNotes = groupStatistics.nGroupedNotes;

    XContentDeduplicator contentDeduplicator;

    connect(&contentDeduplicator, SIGNAL(warningMessage(QString)), this, SIGNAL(warningMessage(QString)));

    result.listGroups = contentDeduplicator.deduplicate(listGroups, result.mapTopics);
    result.dedupStatistics = contentDeduplicator.getStatistics();
    result.validation = XContentDeduplicator::validate(listGroups, result.listGroups, g_options.dReductionThreshold);

    result.stats.nOutputRecords = result.listGroups.count();
    result.stats.nDroppedGroups = result.dedupStatistics.nGroupsDropped;
    result.stats.nDuplicatesRemoved = result.dedupStatistics.nDuplicatesRemoved;

    for (qint32 i = 0; i < result.validation.listIssues.count(); i++) {
        emit warningMessage(result.validation.listIssues.at(i));
    }

    result.bSuccess = true;

    return result;
}

bool XMarginPkgImporter::selectDatabaseRecord(const QList<XPkgZip::RECORD> &listRecords, const QStringList &listPatterns, XPkgZip::RECORD *pRecord)
{
    bool bResult = false;

    QList<QRegularExpression> listRegExps;

    for (qint32 i = 0; i < listPatterns.count(); i++) {
        listRegExps.append(QRegularExpression(listPatterns.at(i), QRegularExpression::CaseInsensitiveOption));
    }

    QList<XPkgZip::RECORD> listFiles;

    for (qint32 i = 0; i < listRecords.count(); i++) {
        // Directory entries
        if (!listRecords.at(i).sFileName.endsWith('/')) {
            listFiles.append(listRecords.at(i));
        }
    }

    qint32 nNumberOfFiles = listFiles.count();

    for (qint32 i = 0; (i < nNumberOfFiles) && (!bResult); i++) {
        for (qint32 j = 0; j < listRegExps.count(); j++) {
            if (listRegExps.at(j).match(listFiles.at(i).sFileName).hasMatch()) {
                *pRecord = listFiles.at(i);
                bResult = true;
                break;
            }
        }
    }

    if ((!bResult) && nNumberOfFiles) {
        *pRecord = listFiles.at(0);

        for (qint32 i = 1; i < nNumberOfFiles; i++) {
            if (listFiles.at(i).nUncompressedSize > pRecord->nUncompressedSize) {
                *pRecord = listFiles.at(i);
            }
        }

        bResult = true;
    }

    return bResult;
}

XMarginPkgImporter::IMPORT_RESULT XMarginPkgImporter::_createResult()
{
    IMPORT_RESULT result;

    result.bSuccess = false;
    result.errorType = XMarginNote::ERRORTYPE_NONE;
    result.stats = {};
    result.dedupStatistics = {};
    result.validation = {};

    return result;
}

void XMarginPkgImporter::_fail(IMPORT_RESULT *pResult, XMarginNote::ERRORTYPE errorType, const QString &sText)
{
    pResult->bSuccess = false;
    pResult->errorType = errorType;
    pResult->sErrorString = QString("%1: %2").arg(XMarginNote::errorTypeToString(errorType), sText);

    emit errorMessage(pResult->sErrorString);
}
