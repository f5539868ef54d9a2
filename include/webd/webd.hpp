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
 * @file webd.hpp
 * @brief webd - HTTP/1.0 request parsing and RFC 6455 WebSocket sessions
 *
 * Synchronous, one connection at a time. A request is parsed off the
 * stream and handed to the application together with the stream; the
 * application either answers in plain HTTP or upgrades to a Session.
 *
 * Usage:
 *   #include "webd/webd.hpp"
 *
 *   int main() {
 *     webd::Server server(webd::ServerConfig{}, [](webd::Request req, webd::BufferedStream stream) {
 *       auto up = webd::upgrade(std::move(req), std::move(stream));
 *       if (!up.is_upgraded())
 *         return webd::Result<void>::success();
 *       auto session = up.take_session();
 *       while (true) {
 *         auto msg = session->next_message();
 *         if (!msg || !msg.value())
 *           break;
 *         session->send(msg.value().value().text());
 *       }
 *       return webd::Result<void>::success();
 *     });
 *     server.run();
 *   }
 *
 * @see RFC 1945: Hypertext Transfer Protocol -- HTTP/1.0
 * @see RFC 6455: The WebSocket Protocol
 */

#ifndef WEBD_WEBD_HPP_
#define WEBD_WEBD_HPP_

#include "frame.hpp"
#include "handshake.hpp"
#include "http.hpp"
#include "log.hpp"
#include "response.hpp"
#include "server.hpp"
#include "session.hpp"
#include "stream.hpp"
#include "vocabulary.hpp"

#endif  // WEBD_WEBD_HPP_
