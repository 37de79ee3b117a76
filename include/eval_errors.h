// -------------------------------------------------------------------------------------------------
//
// Copyright (C) all of the contributors. All rights reserved.
//
// This software, including documentation, is protected by copyright controlled by
// contributors. All rights are reserved. Copying, including reproducing, storing,
// adapting or translating, any or all of this material requires the prior written
// consent of all contributors.
//
// -------------------------------------------------------------------------------------------------

#pragma once

#include <stdexcept>
#include <string>

/**
 * @file eval_errors.h
 * @brief Exception types raised by the evaluation core and its collaborators
 *
 * Recovery scope:
 * - configuration_error:      one setting, falls back to its default
 * - undefined_metric_error:   one metric of one transcript, reported as not evaluated
 * - missing_performance_data: latency/RTF of one transcript, skipped and flagged
 * - missing_reference_error:  whole run, aborts before any evaluation
 * - discovery_error:          whole run, aborts before any evaluation
 */

/// A setting could not be parsed or is out of range.
class configuration_error : public std::invalid_argument {
public:
    explicit configuration_error(const std::string& what) : std::invalid_argument(what) {}
};

/// Zero or more than one ground-truth file was found.
class missing_reference_error : public std::runtime_error {
public:
    explicit missing_reference_error(const std::string& what) : std::runtime_error(what) {}
};

/// Texts directory missing or no hypothesis transcripts in it.
class discovery_error : public std::runtime_error {
public:
    explicit discovery_error(const std::string& what) : std::runtime_error(what) {}
};

/// No usable latency entry exists for a transcript.
class missing_performance_data : public std::runtime_error {
public:
    explicit missing_performance_data(const std::string& what) : std::runtime_error(what) {}
};

/// Degenerate input makes a metric undefined (e.g. empty reference for WER/CER).
class undefined_metric_error : public std::domain_error {
public:
    explicit undefined_metric_error(const std::string& what) : std::domain_error(what) {}
};
