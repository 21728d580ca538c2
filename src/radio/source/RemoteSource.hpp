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

#include <algorithm>     // std::max
#include <atomic>
#include <conwrap2/ProcessorProxy.hpp>
#include <cstddef>       // std::size_t
#include <cstdint>       // std::uint8_t, std::uint64_t
#include <functional>    // std::reference_wrapper
#include <memory>
#include <string>
#include <scope_guard.hpp>
#include <type_safe/optional.hpp>

#include "radio/ContainerBase.hpp"
#include "radio/http/Callbacks.hpp"
#include "radio/http/ContentType.hpp"
#include "radio/http/Header.hpp"
#include "radio/http/HeaderParser.hpp"
#include "radio/http/Request.hpp"
#include "radio/http/StreamDescriptor.hpp"
#include "radio/http/URL.hpp"
#include "radio/icy/MetadataParser.hpp"
#include "radio/icy/MetadataProcessor.hpp"
#include "radio/log/log.hpp"
#include "radio/source/ConsumerMode.hpp"
#include "radio/source/DelegateBase.hpp"
#include "radio/source/Position.hpp"
#include "radio/source/SourceBase.hpp"
#include "radio/util/SharedBuffer.hpp"
#include "radio/util/StateMachine.hpp"


namespace radio
{
	namespace source
	{
		namespace ts = type_safe;

		/**
		 * Turns an HTTP resource into a seekable sequence of audio bytes with ICY metadata stripped out.
		 *
		 * Everything except read() and getPosition() must be called on the work queue
		 * the transport delivers its events to. TransportType must deliver events asynchronously,
		 * never from within request().
		 */
		template <typename TransportType>
		class RemoteSource : public SourceBase
		{
			public:
				enum Event
				{
					OpenEvent,
					HeaderEvent,
					AcceptEvent,
					RangeExhaustedEvent,
					RejectEvent,
					DataEvent,
					CompleteEvent,
					FailureEvent,
					CloseEvent,
				};

				enum State
				{
					IdleState,
					RequestingState,
					HeaderReceivedState,
					StreamingState,
					EndedState,
					FailedState,
				};

				RemoteSource(conwrap2::ProcessorProxy<std::unique_ptr<ContainerBase>> pp, std::reference_wrapper<TransportType> tr, std::weak_ptr<DelegateBase> de, ConsumerMode mo = ConsumerMode::Pull, std::size_t rb = 64 * 1024, std::unique_ptr<icy::MetadataParserBase> pa = std::make_unique<icy::MetadataParser>())
				: processorProxy{pp}
				, transport{tr}
				, delegate{de}
				, consumerMode{mo}
				, sharedBuffer{std::max(rb, 4 * tr.get().getChunkSize())}
				, metadataProcessor{std::move(pa)}
				, stateMachine
				{
					IdleState,  // initial state
					{   // transition table definition
						{OpenEvent,           IdleState,           RequestingState,     [&](auto event) {sendRequest();}, [&] {return true;}},
						{OpenEvent,           RequestingState,     RequestingState,     [&](auto event) {sendRequest();}, [&] {return true;}},
						{OpenEvent,           HeaderReceivedState, RequestingState,     [&](auto event) {sendRequest();}, [&] {return true;}},
						{OpenEvent,           StreamingState,      RequestingState,     [&](auto event) {sendRequest();}, [&] {return true;}},
						{OpenEvent,           EndedState,          RequestingState,     [&](auto event) {sendRequest();}, [&] {return true;}},
						{OpenEvent,           FailedState,         RequestingState,     [&](auto event) {sendRequest();}, [&] {return true;}},
						{HeaderEvent,         RequestingState,     HeaderReceivedState, [&](auto event) {},               [&] {return true;}},
						{AcceptEvent,         HeaderReceivedState, StreamingState,      [&](auto event) {},               [&] {return true;}},
						{RangeExhaustedEvent, HeaderReceivedState, EndedState,          [&](auto event) {stateChangeToRangeExhausted();}, [&] {return true;}},
						{RejectEvent,         HeaderReceivedState, FailedState,         [&](auto event) {stateChangeToFailed();}, [&] {return true;}},
						{DataEvent,           StreamingState,      StreamingState,      [&](auto event) {},               [&] {return true;}},
						{CompleteEvent,       StreamingState,      EndedState,          [&](auto event) {stateChangeToEnded();}, [&] {return true;}},
						{FailureEvent,        RequestingState,     FailedState,         [&](auto event) {stateChangeToFailed();}, [&] {return true;}},
						{FailureEvent,        HeaderReceivedState, FailedState,         [&](auto event) {stateChangeToFailed();}, [&] {return true;}},
						{FailureEvent,        StreamingState,      FailedState,         [&](auto event) {stateChangeToFailed();}, [&] {return true;}},
						{CloseEvent,          IdleState,           IdleState,           [&](auto event) {},               [&] {return true;}},
						{CloseEvent,          RequestingState,     IdleState,           [&](auto event) {},               [&] {return true;}},
						{CloseEvent,          HeaderReceivedState, IdleState,           [&](auto event) {},               [&] {return true;}},
						{CloseEvent,          StreamingState,      IdleState,           [&](auto event) {},               [&] {return true;}},
						{CloseEvent,          EndedState,          IdleState,           [&](auto event) {},               [&] {return true;}},
						{CloseEvent,          FailedState,         IdleState,           [&](auto event) {},               [&] {return true;}},
					}
				}
				{
					if (sharedBuffer.getCapacity() > rb)
					{
						LOG(WARNING) << LABELS{"source"} << "Read buffer size was increased to fit transport chunks (size=" << sharedBuffer.getCapacity() << ")";
					}

					metadataProcessor.setMetadataCallback([&](auto metadata, auto audioOffset)
					{
						onMetadata(metadata, audioOffset);
					});

					LOG(DEBUG) << LABELS{"source"} << "Remote source object was created (id=" << this << ")";
				}

				virtual ~RemoteSource()
				{
					cancelRequest();

					LOG(DEBUG) << LABELS{"source"} << "Remote source object was deleted (id=" << this << ")";
				}

				virtual void close() override
				{
					cancelRequest();
					sharedBuffer.clear([] {});

					stateMachine.processEvent(CloseEvent, [&](auto event, auto state)
					{
						LOG(WARNING) << LABELS{"source"} << "Invalid source state while processing Close event (state=" << state << ")";
					});
				}

				virtual http::ContentTypeSelection getContentTypeHint() const override
				{
					if (descriptor.has_value())
					{
						return descriptor.value().contentTypeHint;
					}

					return http::contentTypeFromExtension(url.getExtension());
				}

				inline auto& getDescriptor() const
				{
					return descriptor;
				}

				inline auto getHTTPStatus() const
				{
					return httpStatus;
				}

				virtual ts::optional<std::uint64_t> getLength() const override
				{
					if (descriptor.has_value() && descriptor.value().totalLength.has_value())
					{
						return descriptor.value().totalLength;
					}

					return discoveredLength;
				}

				inline auto& getMetadataProcessor()
				{
					return metadataProcessor;
				}

				virtual std::uint64_t getPosition() const override
				{
					return sharedBuffer.synchronize([&]
					{
						return position.getAbsolute();
					});
				}

				inline auto getSeekOffset() const
				{
					return sharedBuffer.synchronize([&]
					{
						return position.seekOffset;
					});
				}

				inline State getState() const
				{
					return stateMachine.state;
				}

				inline auto isTransportPaused() const
				{
					return transportPaused.load();
				}

				// throws radio::Exception if url is malformed
				virtual void open(const std::string& u, http::Headers headers, std::uint64_t seekOffset = 0) override
				{
					auto newURL{http::URL::parse(u)};

					// what was learned about another resource does not apply
					if (newURL.toString() != url.toString())
					{
						descriptor       = ts::nullopt;
						discoveredLength = ts::nullopt;
					}
					url            = std::move(newURL);
					requestHeaders = std::move(headers);

					reopen(seekOffset);
				}

				virtual std::size_t read(std::uint8_t* data, std::size_t size) override
				{
					std::size_t freeSize{0};
					auto        result{sharedBuffer.read(data, size, [&](auto readSize, auto fs)
					{
						position.bytesReceived += readSize;
						freeSize                = fs;
					})};

					// transport is resumed once at least half of the buffer is free
					if (transportPaused && freeSize >= sharedBuffer.getCapacity() / 2 && !resumePending.exchange(true))
					{
						processorProxy.process([&, weakToken = std::weak_ptr<bool>{token}]
						{
							if (weakToken.expired())
							{
								return;
							}

							resumePending = false;
							resumeTransport();
						});
					}

					return result;
				}

				virtual void seek(std::uint64_t offset) override
				{
					if (descriptor.has_value() && !descriptor.value().supportsByteRange && offset != getPosition())
					{
						LOG(INFO) << LABELS{"source"} << "Skipping seek as resource does not support byte ranges (offset=" << offset << ")";
						return;
					}

					LOG(INFO) << LABELS{"source"} << "Seeking (offset=" << offset << ")";

					reopen(offset);
				}

			protected:
				void cancelRequest()
				{
					ts::with(activeRequestID, [&](auto& requestID)
					{
						transport.get().cancel(requestID);
					});
					activeRequestID = ts::nullopt;
				}

				// emits audio bytes in stream order
				void deliver(std::uint8_t* data, std::size_t size)
				{
					if (!size)
					{
						return;
					}

					bytesProduced += size;

					if (consumerMode == ConsumerMode::Push)
					{
						sharedBuffer.synchronize([&]
						{
							position.bytesReceived += size;
						});

						withDelegate([&](auto& delegate)
						{
							delegate.onDataAvailable(*this, data, size);
						});
					}
					else
					{
						auto written{sharedBuffer.write(data, size)};
						if (written < size)
						{
							LOG(ERROR) << LABELS{"source"} << "Read buffer overflow, audio data was lost (size=" << (size - written) << ")";
						}

						if (sharedBuffer.getFreeSize() < 2 * transport.get().getChunkSize() && !transportPaused)
						{
							ts::with(activeRequestID, [&](auto& requestID)
							{
								LOG(DEBUG) << LABELS{"source"} << "Pausing transport as read buffer is almost full (request=" << requestID << ")";

								transportPaused = true;
								transport.get().pause(requestID);
							});
						}

						withDelegate([&](auto& delegate)
						{
							delegate.onDataAvailable(*this, nullptr, written);
						});
					}
				}

				inline bool isActive(http::RequestID requestID) const
				{
					return activeRequestID.has_value() && activeRequestID.value() == requestID;
				}

				void onComplete(http::RequestID requestID)
				{
					if (!isActive(requestID))
					{
						return;
					}

					stateMachine.processEvent(CompleteEvent, [&](auto event, auto state)
					{
						LOG(WARNING) << LABELS{"source"} << "Invalid source state while processing Complete event (state=" << state << ")";
					});
				}

				void onData(http::RequestID requestID, std::uint8_t* data, std::size_t size)
				{
					if (!isActive(requestID))
					{
						return;
					}

					if (!stateMachine.processEvent(DataEvent, [&](auto event, auto state)
					{
						LOG(DEBUG) << LABELS{"source"} << "Skipping data received in a non-streaming state (state=" << state << ", size=" << size << ")";
					}))
					{
						return;
					}

					// metadata callback delivers audio preceding each record, the rest is delivered here
					chunkRequestID = requestID;
					chunkData      = data;
					chunkDelivered = 0;
					::util::scope_guard onExit = [&]
					{
						chunkData = nullptr;
					};

					auto audioSize{metadataProcessor.processInPlace(data, size)};
					if (isActive(requestID) && audioSize > chunkDelivered)
					{
						deliver(data + chunkDelivered, audioSize - chunkDelivered);
					}
				}

				void onFailure(http::RequestID requestID, const std::string& message)
				{
					if (!isActive(requestID))
					{
						return;
					}

					LOG(WARNING) << LABELS{"source"} << "Transport failure (request=" << requestID << ", error='" << message << "')";

					stateMachine.processEvent(FailureEvent, [&](auto event, auto state)
					{
						LOG(WARNING) << LABELS{"source"} << "Invalid source state while processing Failure event (state=" << state << ")";
					});
				}

				void onHeader(http::RequestID requestID, unsigned int status, const http::Headers& headers)
				{
					if (!isActive(requestID))
					{
						return;
					}

					// header is parsed once per connection
					if (httpStatus)
					{
						LOG(WARNING) << LABELS{"source"} << "Skipping duplicate response header (request=" << requestID << ", status=" << status << ")";
						return;
					}
					httpStatus = status;

					stateMachine.processEvent(HeaderEvent, [&](auto event, auto state)
					{
						LOG(WARNING) << LABELS{"source"} << "Invalid source state while processing Header event (state=" << state << ")";
					});

					auto parsed{http::HeaderParser::parse(status, headers, url)};
					if (status < 300)
					{
						descriptor = parsed;
					}
					else if (status == 416)
					{
						// server that rejects a range understands ranges; length may be known from a previous response
						if (!parsed.totalLength.has_value() && descriptor.has_value())
						{
							parsed.totalLength = descriptor.value().totalLength;
						}
						parsed.supportsByteRange = true;
						descriptor               = parsed;
					}

					// a full response starts at the first byte whatever range was requested
					if (status == 200)
					{
						auto requestedOffset{sharedBuffer.synchronize([&]
						{
							auto offset{position.seekOffset};
							position.seekOffset = 0;
							return offset;
						})};

						if (requestedOffset)
						{
							LOG(WARNING) << LABELS{"source"} << "Server ignored the requested range, streaming from the start (request=" << requestID << ", offset=" << requestedOffset << ")";
						}
					}

					if (status < 300 && parsed.metadataInterval.has_value())
					{
						metadataProcessor.start(parsed.metadataInterval.value());
					}
					else
					{
						metadataProcessor.reset();
					}

					LOG(INFO) << LABELS{"source"} << "Response header was processed (request=" << requestID
						<< ", status="   << status
						<< ", length="   << (parsed.totalLength.has_value() ? std::to_string(parsed.totalLength.value()) : std::string{"unknown"})
						<< ", ranges="   << parsed.supportsByteRange
						<< ", metaint="  << (parsed.metadataInterval.has_value() ? parsed.metadataInterval.value() : 0)
						<< ", type="     << parsed.contentTypeHint
						<< ")";

					auto headerEvent{AcceptEvent};
					if (status == 416)
					{
						headerEvent = RangeExhaustedEvent;
					}
					else if (status >= 300)
					{
						headerEvent = RejectEvent;
					}

					stateMachine.processEvent(headerEvent, [&](auto event, auto state)
					{
						LOG(WARNING) << LABELS{"source"} << "Invalid source state while processing response header (event=" << event << ", state=" << state << ")";
					});
				}

				void onMetadata(const icy::Metadata& metadata, std::size_t audioOffset)
				{
					// delegate may have closed or reopened the source while handling this chunk
					if (!chunkData || !isActive(chunkRequestID))
					{
						return;
					}

					// audio preceding the record goes out first
					if (audioOffset > chunkDelivered)
					{
						deliver(chunkData + chunkDelivered, audioOffset - chunkDelivered);
						chunkDelivered = audioOffset;

						if (!isActive(chunkRequestID))
						{
							return;
						}
					}

					LOG(DEBUG) << LABELS{"source"} << "Metadata was received (fields=" << metadata.size() << ")";

					withDelegate([&](auto& delegate)
					{
						delegate.onMetadata(*this, metadata);
					});
				}

				void reopen(std::uint64_t offset)
				{
					cancelRequest();

					sharedBuffer.clear([&]
					{
						position.reset(offset);
					});
					bytesProduced   = 0;
					httpStatus      = 0;
					transportPaused = false;

					stateMachine.processEvent(OpenEvent, [&](auto event, auto state)
					{
						LOG(WARNING) << LABELS{"source"} << "Invalid source state while processing Open event (state=" << state << ")";
					});
				}

				void resumeTransport()
				{
					if (!transportPaused)
					{
						return;
					}
					transportPaused = false;

					ts::with(activeRequestID, [&](auto& requestID)
					{
						LOG(DEBUG) << LABELS{"source"} << "Resuming transport (request=" << requestID << ")";

						transport.get().resume(requestID);
					});
				}

				void sendRequest()
				{
					http::Request request;

					request.url     = url;
					request.headers = requestHeaders;
					request.headers.insert_or_assign("Accept", "*/*");
					request.headers.insert_or_assign("Icy-MetaData", "1");

					auto seekOffset{getSeekOffset()};
					if (descriptor.has_value() && descriptor.value().supportsByteRange && seekOffset > 0)
					{
						request.headers.insert_or_assign("Range", "bytes=" + std::to_string(seekOffset) + "-");
					}

					http::Callbacks callbacks;
					callbacks.setHeaderCallback([&](auto requestID, auto status, auto& headers)
					{
						onHeader(requestID, status, headers);
					});
					callbacks.setDataCallback([&](auto requestID, auto* data, auto size)
					{
						onData(requestID, data, size);
					});
					callbacks.setCompleteCallback([&](auto requestID)
					{
						onComplete(requestID);
					});
					callbacks.setFailureCallback([&](auto requestID, auto& message)
					{
						onFailure(requestID, message);
					});

					activeRequestID = transport.get().request(std::move(request), std::move(callbacks));

					LOG(INFO) << LABELS{"source"} << "Request was issued (request=" << activeRequestID.value() << ", url=" << url.toString() << ", offset=" << seekOffset << ")";
				}

				void stateChangeToEnded()
				{
					activeRequestID = ts::nullopt;

					if (!descriptor.has_value() || !descriptor.value().totalLength.has_value())
					{
						discoveredLength = getSeekOffset() + bytesProduced;
					}

					LOG(INFO) << LABELS{"source"} << "End of stream was reached (position=" << getPosition() << ")";

					withDelegate([&](auto& delegate)
					{
						delegate.onEndOfFile(*this);
					});
				}

				void stateChangeToFailed()
				{
					cancelRequest();

					LOG(WARNING) << LABELS{"source"} << "Stream failed (status=" << httpStatus << ")";

					withDelegate([&](auto& delegate)
					{
						delegate.onError(*this);
					});
				}

				void stateChangeToRangeExhausted()
				{
					// body of the rejection is not needed
					cancelRequest();

					ts::with(descriptor.value().totalLength, [&](auto& totalLength)
					{
						sharedBuffer.synchronize([&]
						{
							position.seekOffset = totalLength;
						});
					});

					LOG(INFO) << LABELS{"source"} << "Requested range is beyond the end of resource (offset=" << getSeekOffset() << ")";

					withDelegate([&](auto& delegate)
					{
						delegate.onEndOfFile(*this);
					});
				}

				template <typename FunctionType>
				void withDelegate(FunctionType fun)
				{
					// expired delegate silently stops receiving events
					if (auto delegatePtr{delegate.lock()})
					{
						fun(*delegatePtr);
					}
				}

			private:
				conwrap2::ProcessorProxy<std::unique_ptr<ContainerBase>> processorProxy;
				std::reference_wrapper<TransportType>                    transport;
				std::weak_ptr<DelegateBase>                              delegate;
				ConsumerMode                                             consumerMode;
				http::URL                                                url;
				http::Headers                                            requestHeaders;
				ts::optional<http::StreamDescriptor>                     descriptor{ts::nullopt};
				ts::optional<std::uint64_t>                              discoveredLength{ts::nullopt};
				unsigned int                                             httpStatus{0};
				ts::optional<http::RequestID>                            activeRequestID{ts::nullopt};
				Position                                                 position;
				std::uint64_t                                            bytesProduced{0};
				util::SharedBuffer                                       sharedBuffer;
				std::atomic<bool>                                        transportPaused{false};
				std::atomic<bool>                                        resumePending{false};
				icy::MetadataProcessor                                   metadataProcessor;
				http::RequestID                                          chunkRequestID{0};
				std::uint8_t*                                            chunkData{nullptr};
				std::size_t                                              chunkDelivered{0};
				util::StateMachine<Event, State>                         stateMachine;
				std::shared_ptr<bool>                                    token{std::make_shared<bool>(true)};
		};
	}
}
