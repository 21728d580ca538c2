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

#include <g3log/g3log.hpp>
#include <g3log/loglevels.hpp>
#include <ostream>


// g3log provides DEBUG, INFO, WARNING and FATAL; ERROR sits between WARNING and FATAL
const LEVELS ERROR{WARNING.value + 1, {"ERROR"}};


// tags a log message with a subsystem name, e.g. LOG(INFO) << LABELS{"http"} << "..."
struct LABELS
{
	const char* label;
};

inline std::ostream& operator<<(std::ostream& os, const LABELS& labels)
{
	return os << "{" << labels.label << "} ";
}
