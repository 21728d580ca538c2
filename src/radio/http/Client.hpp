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

#include <algorithm>     // std::find_if, std::remove_if
#include <conwrap2/ProcessorProxy.hpp>
#include <cstddef>       // std::size_t
#include <exception>     // std::exception
#include <memory>
#include <string>
#include <vector>

#include "radio/ContainerBase.hpp"
#include "radio/http/Callbacks.hpp"
#include "radio/http/Connection.hpp"
#include "radio/http/Request.hpp"
#include "radio/log/log.hpp"


namespace radio
{
	namespace http
	{
		// keeps track of outstanding requests; must be used from the processor thread only
		class Client
		{
			public:
				explicit Client(conwrap2::ProcessorProxy<std::unique_ptr<ContainerBase>> pp, std::size_t cs = 4096)
				: processorProxy{pp}
				, chunkSize{cs}
				{
					LOG(DEBUG) << LABELS{"http"} << "Client object was created (id=" << this << ")";
				}

				~Client()
				{
					// connections post their removal, so the vector is dropped without waiting for it
					for (auto& connectionPtr : connections)
					{
						connectionPtr->stop();
					}

					LOG(DEBUG) << LABELS{"http"} << "Client object was deleted (id=" << this << ")";
				}

				Client(const Client&) = delete;             // non-copyable
				Client& operator=(const Client&) = delete;  // non-assignable
				Client(Client&& rhs) = delete;              // non-movable
				Client& operator=(Client&& rhs) = delete;   // non-movable-assignable

				void cancel(RequestID requestID)
				{
					withConnection(requestID, [&](auto& connection)
					{
						connection.stop();
					});
				}

				inline auto getChunkSize() const
				{
					return chunkSize;
				}

				void pause(RequestID requestID)
				{
					withConnection(requestID, [&](auto& connection)
					{
						connection.pause();
					});
				}

				RequestID request(Request request, Callbacks callbacks)
				{
					auto requestID{++lastRequestID};

					// a failing callback must not tear down the transport
					Callbacks guarded;
					guarded.setHeaderCallback([callback = callbacks.getHeaderCallback()](auto id, auto status, auto& headers)
					{
						try
						{
							callback(id, status, headers);
						}
						catch (const std::exception& error)
						{
							LOG(ERROR) << LABELS{"http"} << "Error while invoking 'on header' callback: " << error.what();
						}
					});
					guarded.setDataCallback([callback = callbacks.getDataCallback()](auto id, auto* data, auto size)
					{
						try
						{
							callback(id, data, size);
						}
						catch (const std::exception& error)
						{
							LOG(ERROR) << LABELS{"http"} << "Error while invoking 'on data' callback: " << error.what();
						}
					});
					guarded.setCompleteCallback([callback = callbacks.getCompleteCallback()](auto id)
					{
						try
						{
							callback(id);
						}
						catch (const std::exception& error)
						{
							LOG(ERROR) << LABELS{"http"} << "Error while invoking 'on complete' callback: " << error.what();
						}
					});
					guarded.setFailureCallback([callback = callbacks.getFailureCallback()](auto id, auto& message)
					{
						try
						{
							callback(id, message);
						}
						catch (const std::exception& error)
						{
							LOG(ERROR) << LABELS{"http"} << "Error while invoking 'on failure' callback: " << error.what();
						}
					});

					connections.push_back(std::make_unique<Connection>(processorProxy, requestID, std::move(request), std::move(guarded), chunkSize, [&](auto& connection)
					{
						removeConnection(connection);
					}));
					connections.back()->start();

					return requestID;
				}

				void resume(RequestID requestID)
				{
					withConnection(requestID, [&](auto& connection)
					{
						connection.resume();
					});
				}

			protected:
				void removeConnection(Connection& connection)
				{
					connections.erase(std::remove_if(connections.begin(), connections.end(), [&](auto& connectionPtr)
					{
						return connectionPtr.get() == &connection;
					}), connections.end());

					LOG(DEBUG) << LABELS{"http"} << "Connection was removed (id=" << &connection << ", connections=" << connections.size() << ")";
				}

				template <typename FunctionType>
				void withConnection(RequestID requestID, FunctionType fun)
				{
					auto found{std::find_if(connections.begin(), connections.end(), [&](auto& connectionPtr)
					{
						return connectionPtr->getRequestID() == requestID;
					})};

					if (found != connections.end())
					{
						fun(**found);
					}
				}

			private:
				conwrap2::ProcessorProxy<std::unique_ptr<ContainerBase>> processorProxy;
				std::size_t                                              chunkSize;
				RequestID                                                lastRequestID{0};
				std::vector<std::unique_ptr<Connection>>                 connections;
		};
	}
}
