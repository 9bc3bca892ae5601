#ifndef SETTINGS_REVIEW_HPP
#define SETTINGS_REVIEW_HPP

// Include all library headers here
#include "carb_absorption.hpp"
#include "combined_estimator.hpp"
#include "diagnostic_report.hpp"
#include "estimation_config.hpp"
#include "estimation_interval.hpp"
#include "glucose_series.hpp"
#include "interval_assembler.hpp"
#include "projection_solver.hpp"
#include "session_io.hpp"

// This is the main header file for the settings_review library
// Include this single header to access all functionality

#endif // SETTINGS_REVIEW_HPP
