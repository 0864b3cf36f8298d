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
#include "xdeflatedecoder.h"

const qint32 N_BUFFER_SIZE = 65536;

XDeflateDecoder::XDeflateDecoder(QObject *parent) : QObject(parent)
{
}

bool XDeflateDecoder::decompress(XDataReader::DATAPROCESS_STATE *pDecompressState)
{
    bool bResult = false;

    if (pDecompressState && pDecompressState->pDeviceInput && pDecompressState->pDeviceOutput) {
        pDecompressState->bReadError = false;
        pDecompressState->bWriteError = false;
        pDecompressState->nCountInput = 0;
        pDecompressState->nCountOutput = 0;

        if (!pDecompressState->pDeviceInput->seek(pDecompressState->nInputOffset)) {
            return false;
        }

        char *bufferIn = new char[N_BUFFER_SIZE];
        char *bufferOut = new char[N_BUFFER_SIZE];

        z_stream strm;

        strm.zalloc = nullptr;
        strm.zfree = nullptr;
        strm.opaque = nullptr;
        strm.avail_in = 0;
        strm.next_in = nullptr;

        qint32 ret = Z_OK;

        if (inflateInit2(&strm, -MAX_WBITS) == Z_OK)  // -MAX_WBITS for raw data
        {
            do {
                qint32 nBufferSize = (pDecompressState->nInputLimit == -1)
                                         ? N_BUFFER_SIZE
                                         : (qint32)qMin(pDecompressState->nInputLimit - pDecompressState->nCountInput, (qint64)N_BUFFER_SIZE);
                strm.avail_in = XDataReader::_readDevice(bufferIn, nBufferSize, pDecompressState);

                if (strm.avail_in == 0) {
                    ret = Z_ERRNO;
                    break;
                }

                strm.next_in = (quint8 *)bufferIn;

                do {
                    strm.avail_out = N_BUFFER_SIZE;
                    strm.next_out = (quint8 *)bufferOut;
                    ret = inflate(&strm, Z_NO_FLUSH);

                    if ((ret == Z_DATA_ERROR) || (ret == Z_MEM_ERROR) || (ret == Z_NEED_DICT) || (ret == Z_STREAM_ERROR)) {
                        break;
                    }

                    qint32 nTemp = N_BUFFER_SIZE - strm.avail_out;

                    if (nTemp > 0) {
                        if (!XDataReader::_writeDevice(bufferOut, nTemp, pDecompressState)) {
                            ret = Z_ERRNO;
                            break;
                        }
                    }
                } while ((strm.avail_out == 0) && (ret != Z_STREAM_END));

                if ((ret == Z_DATA_ERROR) || (ret == Z_MEM_ERROR) || (ret == Z_NEED_DICT) || (ret == Z_STREAM_ERROR) || (ret == Z_ERRNO)) {
                    break;
                }
            } while (ret != Z_STREAM_END);

            inflateEnd(&strm);

            bResult = (ret == Z_STREAM_END);
        }

        delete[] bufferIn;
        delete[] bufferOut;
    }

    return bResult;
}

bool XDeflateDecoder::compress(XDataReader::DATAPROCESS_STATE *pCompressState, qint32 nCompressionLevel)
{
    bool bResult = false;

    if (pCompressState && pCompressState->pDeviceInput && pCompressState->pDeviceOutput) {
        pCompressState->bReadError = false;
        pCompressState->bWriteError = false;
        pCompressState->nCountInput = 0;
        pCompressState->nCountOutput = 0;

        if (!pCompressState->pDeviceInput->seek(pCompressState->nInputOffset)) {
            return false;
        }

        z_stream stream;
        stream.zalloc = Z_NULL;
        stream.zfree = Z_NULL;
        stream.opaque = Z_NULL;
        stream.avail_in = 0;
        stream.next_in = Z_NULL;

        if (deflateInit2(&stream, nCompressionLevel, Z_DEFLATED, -MAX_WBITS, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
            return false;
        }

        char *inputBuffer = new char[N_BUFFER_SIZE];
        char *outputBuffer = new char[N_BUFFER_SIZE];

        qint32 nFlush = Z_NO_FLUSH;
        qint32 ret = Z_OK;

        do {
            qint32 nToRead = (pCompressState->nInputLimit == -1) ? N_BUFFER_SIZE
                                                                   : (qint32)qMin(pCompressState->nInputLimit - pCompressState->nCountInput, (qint64)N_BUFFER_SIZE);
            qint32 nRead = XDataReader::_readDevice(inputBuffer, nToRead, pCompressState);

            if (pCompressState->bReadError) {
                break;
            }

            if (nRead == 0) {
                nFlush = Z_FINISH;
            }

            stream.avail_in = nRead;
            stream.next_in = (Bytef *)inputBuffer;

            do {
                stream.avail_out = N_BUFFER_SIZE;
                stream.next_out = (Bytef *)outputBuffer;

                ret = deflate(&stream, nFlush);

                if (ret == Z_STREAM_ERROR) {
                    break;
                }

                qint32 nCompressed = N_BUFFER_SIZE - stream.avail_out;

                if (nCompressed > 0) {
                    if (!XDataReader::_writeDevice(outputBuffer, nCompressed, pCompressState)) {
                        break;
                    }
                }
            } while (stream.avail_out == 0);

            if ((ret == Z_STREAM_ERROR) || pCompressState->bWriteError) {
                break;
            }
        } while (ret != Z_STREAM_END);

        deflateEnd(&stream);

        bResult = (ret == Z_STREAM_END) && (!pCompressState->bReadError) && (!pCompressState->bWriteError);

        delete[] inputBuffer;
        delete[] outputBuffer;
    }

    return bResult;
}

quint32 XDeflateDecoder::getCRC32(const QByteArray &baData)
{
    uLong nResult = crc32(0L, Z_NULL, 0);

    nResult = crc32(nResult, (const Bytef *)baData.constData(), (uInt)baData.size());

    return (quint32)nResult;
}
