#pragma once

// cmd_record_add: insert one record keyed by a fresh "rec-<ULID>" id and print it as JSON.
// Usage: ulidkit_cli record add --kind <kind> [--payload <text>] [--db <db-path>]
//                               [--seed <u64>] [--log-level <level>]
// cmd_record_list: print all records (optionally of one --kind) in creation order.
// Usage: ulidkit_cli record list [--kind <kind>] [--db <db-path>] [--log-level <level>]
int cmd_record_add(int argc, char* argv[]);   // NOLINT(modernize-avoid-c-arrays)
int cmd_record_list(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
