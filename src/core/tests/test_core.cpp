#include <morphic/main.hpp>
#include <cstdio>
#include <string>
#include <thread>
#include "test_context.h"

using namespace mx;

void test_error_messages(TestContext &Context) {
   Context.expect_equal(std::string(GetErrorMsg(ERR::Okay)), std::string("Operation successful."), "Okay has a message");
   Context.expect_true(std::string(GetErrorMsg(ERR::VertexCountMismatch)).size() > 0, "VertexCountMismatch has a message");
   Context.expect_equal(std::string(GetErrorMsg(ERR(9999))), std::string("Unknown error code."), "Out of range codes are reported as unknown");
}

// Flag masks are combined at compile time for the static level tables.

static constexpr VLF WARNING_MASK = VLF::ERROR | VLF::WARNING | VLF::CRITICAL;
static_assert((WARNING_MASK & VLF::WARNING) IS VLF::WARNING, "Flag operators are usable in constant expressions");
static_assert((WARNING_MASK & ~VLF::ERROR) IS (VLF::WARNING | VLF::CRITICAL), "Flag operators compose at compile time");

void test_log_levels(TestContext &Context) {
   int level = -1;
   Context.expect_ok(ParseLogLevel("warning", level), "Level names are recognised");
   Context.expect_equal(level, 2, "warning is level 2");
   Context.expect_ok(ParseLogLevel("TRACE", level), "Level names are case insensitive");
   Context.expect_equal(level, 8, "trace is level 8");
   Context.expect_ok(ParseLogLevel("6", level), "Numeric levels are accepted");
   Context.expect_equal(level, 6, "Numeric level is parsed");
   Context.expect_error(ParseLogLevel("loud", level), ERR::InvalidValue, "Unknown names are rejected");
   Context.expect_error(ParseLogLevel(nullptr, level), ERR::NullArgs, "Null names are rejected");

   int original = GetLogLevel();
   SetLogLevel(42);
   Context.expect_equal(GetLogLevel(), 9, "Levels are clamped to 9");
   SetLogLevel(-3);
   Context.expect_equal(GetLogLevel(), 0, "Levels are clamped to 0");
   SetLogLevel(original);

   Log log("test_log_levels");
   Context.expect_error(log.warning(ERR::NoData), ERR::NoData, "warning(ERR) returns its code");
}

void test_config_parse(TestContext &Context) {
   Config config;
   Context.expect_error(config.parse(""), ERR::NoData, "Empty text is rejected");

   const char text[] =
      "# Test configuration\n"
      "[morphing]\n"
      "vertex_loop_mapper = \"greedy\"\n"
      "  vertex_alignment_norm = l2  \n"
      "\n"
      "[morphing.clustering]\n"
      "# comment within a group\n"
      "max_iterations = 12\n"
      "balance_clusters = off\n"
      "random_seed = abc\n";

   Context.expect_ok(config.parse(text), "Config text parses");

   std::string value;
   Context.expect_ok(config.read("morphing", "vertex_loop_mapper", value), "Group and key read");
   Context.expect_equal(value, std::string("greedy"), "Quotes are stripped");
   Context.expect_ok(config.read("morphing.vertex_alignment_norm", value), "Dotted key read");
   Context.expect_equal(value, std::string("l2"), "Surrounding whitespace is trimmed");
   Context.expect_error(config.read("morphing.missing", value), ERR::Search, "Missing keys report Search");
   Context.expect_error(config.read("nogroup", value), ERR::InvalidValue, "Keys without a group are invalid");

   Context.expect_equal(config.get_int("morphing.clustering.max_iterations", 50), 12, "Integer value");
   Context.expect_false(config.get_bool("morphing.clustering.balance_clusters", true), "Boolean 'off' is false");
   Context.expect_equal(config.get_int("morphing.clustering.random_seed", 42), 42, "Malformed integers use the default");
   Context.expect_equal(config.get_string("logging.level", "warning"), std::string("warning"), "Missing group uses the default");
   Context.expect_true(config.contains("morphing.clustering.max_iterations"), "contains() finds dotted keys");
}

void test_config_merge(TestContext &Context) {
   Config base, overlay;
   base.write("morphing.vertex_loop_mapper", "clustering");
   base.write("morphing", "vertex_alignment_norm", "l1");
   overlay.write("morphing.vertex_loop_mapper", "discrete");
   overlay.write("logging.level", "error");

   base.merge(overlay);
   Context.expect_equal(base.get_string("morphing.vertex_loop_mapper", ""), std::string("discrete"), "Merged keys overwrite");
   Context.expect_equal(base.get_string("morphing.vertex_alignment_norm", ""), std::string("l1"), "Untouched keys survive a merge");
   Context.expect_equal(base.get_string("logging.level", ""), std::string("error"), "New groups are appended");
   Context.expect_equal(base.groups.size(), std::size_t(2), "Existing groups are reused");
}

void test_global_config(TestContext &Context) {
   reset_config();
   auto global = config();
   Context.expect_equal(global.get_string(cfg::VERTEX_LOOP_MAPPER, ""), std::string("clustering"), "Default mapper");
   Context.expect_equal(global.get_int(cfg::CLUSTERING_MAX_ITERATIONS, 0), 50, "Default iterations");
   Context.expect_equal(global.get_int(cfg::CLUSTERING_RANDOM_SEED, 0), 42, "Default seed");
   Context.expect_true(global.get_bool(cfg::CLUSTERING_BALANCE, false), "Balancing is on by default");
   Context.expect_false(global.contains(cfg::ANGULAR_ALIGNMENT_NORM), "Angular norm is unset by default");

   Context.expect_error(load_config("/nonexistent/morphic.toml"), ERR::File, "Missing files report File");

   std::string path = std::string(P_tmpdir) + "/morphic_test_config.toml";
   if (auto fd = fopen(path.c_str(), "w")) {
      fputs("[morphing]\nvertex_loop_mapper = \"simple\"\n\n[logging]\nlevel = \"error\"\n", fd);
      fclose(fd);

      int original = GetLogLevel();
      Context.expect_ok(load_config(path), "User configuration loads");
      Context.expect_equal(config().get_string(cfg::VERTEX_LOOP_MAPPER, ""), std::string("simple"), "User values override defaults");
      Context.expect_equal(config().get_int(cfg::CLUSTERING_MAX_ITERATIONS, 0), 50, "Defaults survive a user file");
      Context.expect_equal(GetLogLevel(), 1, "logging.level is applied");
      SetLogLevel(original);
      remove(path.c_str());
   }
   else Context.expect_true(false, "Temporary config file could be created");

   Config bad;
   bad.write("logging.level", "shouting");
   Context.expect_error(apply_log_level(bad), ERR::InvalidValue, "Unknown log levels are rejected");

   reset_config();
   Context.expect_equal(config().get_string(cfg::VERTEX_LOOP_MAPPER, ""), std::string("clustering"), "reset_config restores defaults");
}

// Readers receive a snapshot that later writes cannot alter, and may read while another thread rewrites the
// process-wide configuration.

void test_config_snapshots(TestContext &Context) {
   reset_config();
   auto before = config();
   write_config(cfg::VERTEX_LOOP_MAPPER, "greedy");
   Context.expect_equal(before.get_string(cfg::VERTEX_LOOP_MAPPER, ""), std::string("clustering"), "Snapshots are unaffected by writes");
   Context.expect_equal(config().get_string(cfg::VERTEX_LOOP_MAPPER, ""), std::string("greedy"), "write_config updates the global configuration");

   before.write(cfg::VERTEX_LOOP_MAPPER, "simple");
   Context.expect_equal(config().get_string(cfg::VERTEX_LOOP_MAPPER, ""), std::string("greedy"), "Writing to a snapshot leaves the global untouched");

   std::thread writer([]() {
      for (int i=0; i < 500; i++) {
         reset_config();
         write_config(cfg::VERTEX_LOOP_MAPPER, "greedy");
      }
   });

   bool consistent = true;
   for (int i=0; i < 500; i++) {
      auto name = config().get_string(cfg::VERTEX_LOOP_MAPPER, "");
      if ((name != "clustering") and (name != "greedy")) consistent = false;
   }
   writer.join();

   Context.expect_true(consistent, "Readers always see a complete configuration during reloads");
   reset_config();
}

int main() {
   TestContext test_context;
   test_error_messages(test_context);
   test_log_levels(test_context);
   test_config_parse(test_context);
   test_config_merge(test_context);
   test_global_config(test_context);
   test_config_snapshots(test_context);
   test_context.summary();
   return test_context.failed_checks IS 0 ? 0 : 1;
}
