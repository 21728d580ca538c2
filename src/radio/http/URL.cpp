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

#include <sstream>

#include "radio/Exception.hpp"
#include "radio/http/Header.hpp"
#include "radio/http/URL.hpp"


namespace radio
{
	namespace http
	{
		URL URL::parse(const std::string& url)
		{
			URL result;

			auto separator{std::string{"://"}};
			auto schemeEnd{url.find(separator)};
			if (schemeEnd == std::string::npos || schemeEnd == 0)
			{
				throw Exception{"Missing scheme in URL '" + url + "'"};
			}

			result.scheme = toLower(url.substr(0, schemeEnd));
			if (result.scheme == "http")
			{
				result.port = 80;
			}
			else if (result.scheme == "https")
			{
				result.port = 443;
			}
			else
			{
				throw Exception{"Unsupported scheme in URL '" + url + "'"};
			}

			// authority ends where path, query or fragment starts
			auto authorityBegin{schemeEnd + separator.length()};
			auto authorityEnd{url.find_first_of("/?#", authorityBegin)};
			auto authority{url.substr(authorityBegin, authorityEnd == std::string::npos ? std::string::npos : authorityEnd - authorityBegin)};

			// dropping credentials if any
			if (auto at{authority.rfind('@')}; at != std::string::npos)
			{
				authority.erase(0, at + 1);
			}

			// IPv6 literals are not supported so the last colon separates the port
			if (auto colon{authority.rfind(':')}; colon != std::string::npos)
			{
				auto portString{authority.substr(colon + 1)};
				authority.erase(colon);

				if (!portString.empty())
				{
					if (portString.find_first_not_of("0123456789") != std::string::npos || portString.length() > 5)
					{
						throw Exception{"Invalid port in URL '" + url + "'"};
					}

					auto port{std::stoul(portString)};
					if (port == 0 || port > 65535)
					{
						throw Exception{"Invalid port in URL '" + url + "'"};
					}
					result.port = static_cast<unsigned short>(port);
				}
			}

			if (authority.empty())
			{
				throw Exception{"Missing host in URL '" + url + "'"};
			}
			result.host = authority;

			if (authorityEnd != std::string::npos)
			{
				auto rest{url.substr(authorityEnd)};

				// fragment is never sent to a server
				if (auto hash{rest.find('#')}; hash != std::string::npos)
				{
					rest.erase(hash);
				}

				auto question{rest.find('?')};
				if (question != std::string::npos)
				{
					result.query = rest.substr(question + 1);
					rest.erase(question);
				}

				if (!rest.empty())
				{
					result.path = rest;
				}
			}

			return result;
		}

		std::string URL::getExtension() const
		{
			auto result{std::string{}};
			auto slash{path.rfind('/')};
			auto segment{slash == std::string::npos ? path : path.substr(slash + 1)};

			if (auto dot{segment.rfind('.')}; dot != std::string::npos && dot + 1 < segment.length())
			{
				result = toLower(segment.substr(dot + 1));
			}

			return result;
		}

		std::string URL::getTarget() const
		{
			return query.empty() ? path : path + "?" + query;
		}

		std::string URL::toString() const
		{
			std::stringstream ss;

			ss << scheme << "://" << host;
			if ((scheme == "http" && port != 80) || (scheme == "https" && port != 443))
			{
				ss << ":" << port;
			}
			ss << getTarget();

			return ss.str();
		}
	}
}
