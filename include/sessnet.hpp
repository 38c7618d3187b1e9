/**
 * MIT License
 *
 * Copyright (c) 2026 liudegui
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

/**
 * @file sessnet.hpp
 * @brief Umbrella header for the sessnet TCP session server.
 *
 * Architecture:
 *   - Server: listener + accept thread, one worker thread per session
 *   - SessionRegistry: key -> live session, the only state shared by workers
 *   - Session: blocking receive loop feeding a MessageDispatcher
 *   - BufferPool: receive buffers shared by all sessions
 *   - TextFragmentation: one text message as text + continuation frames
 *
 * Dependencies: sockpp (connected sockets).
 */

#ifndef SESSNET_HPP_
#define SESSNET_HPP_

#include "sessnet/buffer_pool.hpp"
#include "sessnet/config.hpp"
#include "sessnet/dispatcher.hpp"
#include "sessnet/errors.hpp"
#include "sessnet/frame.hpp"
#include "sessnet/log.hpp"
#include "sessnet/server.hpp"
#include "sessnet/session.hpp"
#include "sessnet/session_registry.hpp"
#include "sessnet/text_fragmentation.hpp"
#include "sessnet/vocabulary.hpp"

#endif  // SESSNET_HPP_
