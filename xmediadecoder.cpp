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
#include "xmediadecoder.h"

QByteArray XMediaDecoder::getPNGSignature()
{
    return QByteArray("\x89PNG\r\n\x1A\n", 8);
}

XMarginNote::MEDIATYPE XMediaDecoder::detectType(const QByteArray &baData)
{
    XMarginNote::MEDIATYPE result = XMarginNote::MEDIATYPE_UNKNOWN;

    if (!baData.isEmpty()) {
        // Images are often wrapped in an archive, so the signature may be inside
        if (baData.indexOf(getPNGSignature()) != -1) {
            result = XMarginNote::MEDIATYPE_IMAGE;
        } else if (baData.contains("apple.ink.pen")) {
            result = XMarginNote::MEDIATYPE_INK;
        } else if (baData.contains("CGRect")) {
            result = XMarginNote::MEDIATYPE_COORDINATES;
        } else {
            result = XMarginNote::MEDIATYPE_BINARY;
        }
    }

    return result;
}

XMarginNote::MEDIARECORD XMediaDecoder::decode(const QString &sMediaHash, const QByteArray &baData)
{
    XMarginNote::MEDIARECORD result = {};

    result.sMediaHash = sMediaHash;
    result.baData = baData;
    result.mediaType = detectType(baData);

    if (result.mediaType == XMarginNote::MEDIATYPE_IMAGE) {
        result.baImage = baData.mid(baData.indexOf(getPNGSignature()));
    } else if (result.mediaType == XMarginNote::MEDIATYPE_INK) {
        result.bHasStrokes = baData.contains("wrd");
    } else if (result.mediaType == XMarginNote::MEDIATYPE_COORDINATES) {
        result.sTextSample = QString::fromUtf8(baData).left(TEXT_SAMPLE_SIZE);
    }

    return result;
}
