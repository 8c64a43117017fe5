#pragma once

// Minimal shared header for the test runner.
//
// Individual tests use their own local CATA_ASSERT macro. This file exists so
// test_main.cpp can include a stable header without depending on any specific
// test framework.

#include <iostream>

int test_calendar();
int test_json();
int test_file_io();
int test_rules_config();
int test_map_graph();
int test_rolls();
int test_orders();
int test_scheduler();
int test_movement();
int test_supply();
int test_siege();
int test_messaging();
int test_naval();
int test_operations();
int test_recruitment();
int test_state_validation();
int test_audit_export();
int test_engine();
