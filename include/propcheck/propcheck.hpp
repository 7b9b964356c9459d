#pragma once

#include <propcheck/asserting.hpp>
#include <propcheck/check_loop.hpp>
#include <propcheck/configuration.hpp>
#include <propcheck/console_logger.hpp>
#include <propcheck/exceptions.hpp>
#include <propcheck/fact.hpp>
#include <propcheck/failure_messages.hpp>
#include <propcheck/failure_report.hpp>
#include <propcheck/future.hpp>
#include <propcheck/generator.hpp>
#include <propcheck/logger.hpp>
#include <propcheck/prettifier.hpp>
#include <propcheck/property_argument.hpp>
#include <propcheck/property_check_result.hpp>
#include <propcheck/property_checker.hpp>
#include <propcheck/randomizer.hpp>
#include <propcheck/reporter.hpp>
#include <propcheck/size.hpp>
#include <propcheck/source_position.hpp>
