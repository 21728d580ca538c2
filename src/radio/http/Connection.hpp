/*
 * Copyright 2017, Andrej Kislovskij
 *
 * This is PUBLIC DOMAIN software so use at your own risk as it comes
 * with no warranties. This code is yours to share, use and modify without
 * any restrictions or obligations.
 *
 * For more information see conwrap/LICENSE or refer refer to http://unlicense.org
 *
 * Author: gimesketvirtadieni at gmail dot com (Andrej Kislovskij)
 */

#pragma once

#include <algorithm>     // std::min
#include <conwrap2/ProcessorProxy.hpp>
#include <cstddef>       // std::size_t
#include <cstdint>       // std::uint8_t, std::uint64_t
#include <cstring>       // std::memcpy
#include <experimental/net>
#include <functional>
#include <memory>
#include <sstream>
#include <string>
#include <system_error>  // std::error_code
#include <type_safe/optional.hpp>

#include "radio/ContainerBase.hpp"
#include "radio/http/Callbacks.hpp"
#include "radio/http/Header.hpp"
#include "radio/http/HeaderParser.hpp"
#include "radio/http/Request.hpp"
#include "radio/log/log.hpp"
#include "radio/util/buffer/HeapBuffer.hpp"


namespace radio
{
	namespace http
	{
		namespace ts = type_safe;

		// one HTTP request over a plain TCP socket; all handlers run on the processor's dispatcher
		class Connection
		{
			public:
				using StopCallbackType = std::function<void(Connection&)>;

				static constexpr std::size_t maxHeaderSize{16384};

				Connection(conwrap2::ProcessorProxy<std::unique_ptr<ContainerBase>> pp, RequestID id, Request rq, Callbacks ca, std::size_t cs, StopCallbackType sc)
				: processorProxy{pp}
				, requestID{id}
				, request{std::move(rq)}
				, callbacks{std::move(ca)}
				, stopCallback{std::move(sc)}
				, resolver{processorProxy.getDispatcher()}
				, nativeSocket{processorProxy.getDispatcher()}
				, buffer{cs}
				{
					LOG(DEBUG) << LABELS{"http"} << "Connection object was created (id=" << this << ", request=" << requestID << ")";
				}

				~Connection()
				{
					closeSocket();

					LOG(DEBUG) << LABELS{"http"} << "Connection object was deleted (id=" << this << ", request=" << requestID << ")";
				}

				// handlers capture 'this'
				Connection(const Connection&) = delete;             // non-copyable
				Connection& operator=(const Connection&) = delete;  // non-assignable
				Connection(Connection&& rhs) = delete;              // non-movable
				Connection& operator=(Connection&& rhs) = delete;   // non-movable-assignable

				inline auto getRequestID() const
				{
					return requestID;
				}

				inline auto isFinished() const
				{
					return finished;
				}

				inline void pause()
				{
					paused = true;
				}

				inline void resume()
				{
					if (!paused)
					{
						return;
					}
					paused = false;

					// reading was suspended only if nothing is in flight
					if (!finished && !pendingOperation && headerReceived)
					{
						readBody();
					}
				}

				void start()
				{
					LOG(INFO) << LABELS{"http"} << "Sending request (request=" << requestID << ", url=" << request.url.toString() << ")";

					if (request.url.getScheme() != "http")
					{
						// reporting asynchronously so the requester already knows the request ID
						pendingOperation = true;
						processorProxy.process([&, weakToken = std::weak_ptr<bool>{token}]
						{
							if (weakToken.expired())
							{
								return;
							}

							if (!onOperationCompleted())
							{
								onFailure("Scheme is not supported by this transport (scheme=" + request.url.getScheme() + ")");
							}
						});
						return;
					}

					pendingOperation = true;
					resolver.async_resolve(request.url.getHost(), std::to_string(request.url.getPort()), [&, weakToken = std::weak_ptr<bool>{token}](const std::error_code error, auto results)
					{
						// connection may be gone when the handler is aborted
						if (weakToken.expired())
						{
							return;
						}

						if (onOperationCompleted())
						{
							return;
						}

						if (error)
						{
							onFailure("Could not resolve host " + request.url.getHost() + ": " + error.message());
							return;
						}

						pendingOperation = true;
						std::experimental::net::async_connect(nativeSocket, results, [&, weakToken = std::weak_ptr<bool>{token}](const std::error_code error, const auto&)
						{
							if (weakToken.expired())
							{
								return;
							}

							onConnect(error);
						});
					});
				}

				// cancels the request; no events are delivered afterwards
				void stop()
				{
					if (finished)
					{
						return;
					}
					finished = true;

					LOG(DEBUG) << LABELS{"http"} << "Cancelling request (request=" << requestID << ")";

					resolver.cancel();
					closeSocket();

					if (!pendingOperation)
					{
						onStop();
					}
				}

			protected:
				void closeSocket()
				{
					std::error_code error;

					if (nativeSocket.is_open())
					{
						nativeSocket.shutdown(std::experimental::net::socket_base::shutdown_both, error);
						nativeSocket.close(error);
					}
				}

				void finish()
				{
					if (finished)
					{
						return;
					}
					finished = true;

					closeSocket();
					if (!pendingOperation)
					{
						onStop();
					}
				}

				void onBody(std::size_t size)
				{
					auto completed{false};

					// servers may keep the socket open after the announced body
					if (contentLength.has_value())
					{
						auto remaining{contentLength.value() - bodyReceived};
						if (size >= remaining)
						{
							size      = static_cast<std::size_t>(remaining);
							completed = true;
						}
					}
					bodyReceived += size;

					if (size > 0)
					{
						callbacks.getDataCallback()(requestID, buffer.getData(), size);
					}

					if (completed)
					{
						onComplete();
					}
					else
					{
						readBody();
					}
				}

				void onComplete()
				{
					if (finished)
					{
						return;
					}

					LOG(INFO) << LABELS{"http"} << "Request was completed (request=" << requestID << ", body=" << bodyReceived << " bytes)";

					callbacks.getCompleteCallback()(requestID);
					finish();
				}

				void onConnect(const std::error_code error)
				{
					if (onOperationCompleted())
					{
						return;
					}

					if (error)
					{
						onFailure("Could not connect to " + request.url.getHost() + ": " + error.message());
						return;
					}

					requestText      = request.toString();
					pendingOperation = true;
					std::experimental::net::async_write(nativeSocket, std::experimental::net::buffer(requestText), [&, weakToken = std::weak_ptr<bool>{token}](const std::error_code error, const std::size_t)
					{
						if (weakToken.expired())
						{
							return;
						}

						if (onOperationCompleted())
						{
							return;
						}

						if (error)
						{
							onFailure("Could not send request: " + error.message());
							return;
						}

						readHeader();
					});
				}

				void onFailure(const std::string& message)
				{
					if (finished)
					{
						return;
					}

					LOG(WARNING) << LABELS{"http"} << "Request failed (request=" << requestID << ", error='" << message << "')";

					callbacks.getFailureCallback()(requestID, message);
					finish();
				}

				void onHeaderData(std::size_t size)
				{
					headerText.append(reinterpret_cast<const char*>(buffer.getData()), size);

					auto terminator{std::string{"\r\n\r\n"}};
					auto end{headerText.find(terminator)};
					if (end == std::string::npos)
					{
						terminator = "\n\n";
						end        = headerText.find(terminator);
					}

					if (end == std::string::npos)
					{
						if (headerText.size() > maxHeaderSize)
						{
							onFailure("Response header is too large");
						}
						else
						{
							readHeader();
						}
						return;
					}

					// whatever follows the header is already a part of the body and comes from the last read only
					auto bodySize{headerText.size() - end - terminator.size()};
					std::memcpy(buffer.getData(), headerText.data() + end + terminator.size(), bodySize);
					headerText.erase(end);

					unsigned int status{0};
					Headers      headers;
					if (!parseHeader(headerText, status, headers))
					{
						onFailure("Malformed response status line");
						return;
					}

					if (auto found{headers.find("Transfer-Encoding")}; found != headers.end() && toLower(trim(found->second)) != "identity")
					{
						onFailure("Transfer encoding is not supported (encoding=" + found->second + ")");
						return;
					}

					if (status < 300)
					{
						if (auto found{headers.find("Content-Length")}; found != headers.end())
						{
							contentLength = HeaderParser::parseUnsigned(found->second);
						}
					}

					LOG(INFO) << LABELS{"http"} << "Response header was received (request=" << requestID << ", status=" << status << ")";

					headerReceived = true;
					callbacks.getHeaderCallback()(requestID, status, headers);

					// requester may cancel this request while handling the header
					if (!finished)
					{
						onBody(bodySize);
					}
				}

				// returns true if the connection was finished while the operation was in flight
				bool onOperationCompleted()
				{
					pendingOperation = false;

					if (finished)
					{
						onStop();
					}

					return finished;
				}

				void onStop()
				{
					// connection cannot be removed here as it may be called by one of its own handlers
					processorProxy.process([&, weakToken = std::weak_ptr<bool>{token}]
					{
						if (weakToken.expired())
						{
							return;
						}

						stopCallback(*this);
					});
				}

				static bool parseHeader(const std::string& text, unsigned int& status, Headers& headers)
				{
					std::stringstream ss{text};
					std::string       line;

					// status line looks like 'HTTP/1.1 200 OK' or 'ICY 200 OK'
					std::getline(ss, line);
					auto firstSpace{line.find(' ')};
					if (firstSpace == std::string::npos)
					{
						return false;
					}
					auto protocol{line.substr(0, firstSpace)};
					if (protocol.rfind("HTTP/", 0) != 0 && protocol != "ICY")
					{
						return false;
					}
					auto code{HeaderParser::parseUnsigned(line.substr(firstSpace + 1, 3))};
					if (!code.has_value() || code.value() < 100 || code.value() > 999)
					{
						return false;
					}
					status = static_cast<unsigned int>(code.value());

					while (std::getline(ss, line))
					{
						auto colon{line.find(':')};

						// malformed lines are skipped
						if (colon != std::string::npos && colon > 0)
						{
							headers.emplace(trim(line.substr(0, colon)), trim(line.substr(colon + 1)));
						}
					}

					return true;
				}

				void readBody()
				{
					if (finished || paused)
					{
						return;
					}

					pendingOperation = true;
					nativeSocket.async_read_some(std::experimental::net::mutable_buffer(buffer.getData(), buffer.getSize()), [&, weakToken = std::weak_ptr<bool>{token}](const std::error_code error, const std::size_t size)
					{
						if (weakToken.expired())
						{
							return;
						}

						if (onOperationCompleted())
						{
							return;
						}

						if (!error)
						{
							onBody(size);
						}
						else if (error == std::experimental::net::stream_errc::eof)
						{
							if (contentLength.has_value() && bodyReceived < contentLength.value())
							{
								onFailure("Connection was closed before the whole body was received");
							}
							else
							{
								onComplete();
							}
						}
						else
						{
							onFailure("Could not receive data: " + error.message());
						}
					});
				}

				void readHeader()
				{
					pendingOperation = true;
					nativeSocket.async_read_some(std::experimental::net::mutable_buffer(buffer.getData(), buffer.getSize()), [&, weakToken = std::weak_ptr<bool>{token}](const std::error_code error, const std::size_t size)
					{
						if (weakToken.expired())
						{
							return;
						}

						if (onOperationCompleted())
						{
							return;
						}

						if (!error)
						{
							onHeaderData(size);
						}
						else if (error == std::experimental::net::stream_errc::eof)
						{
							onFailure("Connection was closed before the response header was received");
						}
						else
						{
							onFailure("Could not receive data: " + error.message());
						}
					});
				}

			private:
				conwrap2::ProcessorProxy<std::unique_ptr<ContainerBase>> processorProxy;
				RequestID                                                requestID;
				Request                                                  request;
				Callbacks                                                callbacks;
				StopCallbackType                                         stopCallback;
				std::experimental::net::ip::tcp::resolver                resolver;
				std::experimental::net::ip::tcp::socket                  nativeSocket;
				util::buffer::HeapBuffer<std::uint8_t>                   buffer;
				std::string                                              requestText;
				std::string                                              headerText;
				ts::optional<std::uint64_t>                              contentLength{ts::nullopt};
				std::uint64_t                                            bodyReceived{0};
				bool                                                     headerReceived{false};
				bool                                                     pendingOperation{false};
				bool                                                     paused{false};
				bool                                                     finished{false};
				std::shared_ptr<bool>                                    token{std::make_shared<bool>(true)};
		};
	}
}
