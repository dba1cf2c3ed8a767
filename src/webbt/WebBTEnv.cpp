/*
 * Author: Sven Gothel <sgothel@jausoft.com>
 * Copyright (c) 2022 Gothel Software e.K.
 *
 * Permission is hereby granted, free of charge, to any person obtaining
 * a copy of this software and associated documentation files (the
 * "Software"), to deal in the Software without restriction, including
 * without limitation the rights to use, copy, modify, merge, publish,
 * distribute, sublicense, and/or sell copies of the Software, and to
 * permit persons to whom the Software is furnished to do so, subject to
 * the following conditions:
 *
 * The above copyright notice and this permission notice shall be
 * included in all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND,
 * EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF
 * MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND
 * NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE
 * LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION
 * OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION
 * WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include <cstdint>
#include <climits>

#include <jau/environment.hpp>

#include "WebBTConst.hpp"
#include "WebBTEnv.hpp"

using namespace webbt;

WebBTEnv::WebBTEnv() noexcept
: DEBUG_GLOBAL( jau::environment::get("webbt").debug ),
  exploding( jau::environment::getExplodingProperties("webbt.scan") ),
  SCAN_TIME_MS( jau::environment::getInt32Property("webbt.scan.time", DEFAULT_SCAN_TIME_MS,
                                                   MIN_SCAN_TIME_MS /* min */, INT32_MAX /* max */) ),
  DEBUG_SCAN_CANDIDATE( jau::environment::getBooleanProperty("webbt.debug.scan.candidate", false) )
{
}
