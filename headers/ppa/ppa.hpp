//
// Created by gregorian-rayne on 10/17/26.
//

#ifndef PPA_PPA_HPP
#define PPA_PPA_HPP

/**
 * @file ppa.hpp
 * @brief Main header for the Python Performance Analyzer library.
 *
 * This header provides convenient access to the checker, its
 * configuration and the JSON report. Include specific headers for more
 * targeted dependencies.
 */

#include "ppa/version.hpp"
#include "ppa/error.hpp"
#include "ppa/result.hpp"
#include "ppa/types.hpp"

#include "ppa/analysis/ast_analyzer.hpp"
#include "ppa/checker/performance_checker.hpp"
#include "ppa/config/checker_config.hpp"
#include "ppa/frontend/frontend.hpp"
#include "ppa/patterns/catalog.hpp"
#include "ppa/report/json_report.hpp"

#endif //PPA_PPA_HPP
