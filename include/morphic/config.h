#pragma once

// Key-value configuration in a simple grouped text format:
//
//   [morphing]
//   vertex_loop_mapper = "clustering"
//
//   [morphing.clustering]
//   max_iterations = 50
//
// Dotted keys such as "morphing.clustering.max_iterations" address the group named by everything before the last dot.

#include <map>
#include <string>
#include <string_view>
#include <vector>
#include <morphic/system/types.h>
#include <morphic/system/errors.h>

namespace mx {

typedef std::map<std::string, std::string, std::less<>> ConfigKeys;
typedef std::pair<std::string, ConfigKeys> ConfigGroup;
typedef std::vector<ConfigGroup> ConfigGroups;

class Config {
   public:
      ConfigGroups groups;

      ERR parse(std::string_view Text);
      ERR load(const std::string &Path);
      void merge(const Config &Source);
      void clear() { groups.clear(); }

      ERR read(std::string_view Group, std::string_view Key, std::string &Value) const;
      void write(std::string_view Group, std::string_view Key, std::string_view Value);

      ERR read(std::string_view Key, std::string &Value) const;
      void write(std::string_view Key, std::string_view Value);

      bool contains(std::string_view Key) const;
      std::string get_string(std::string_view Key, std::string_view Default) const;
      int get_int(std::string_view Key, int Default) const;
      bool get_bool(std::string_view Key, bool Default) const;

      const ConfigKeys * find_group(std::string_view Group) const;
};

// Configuration keys recognised by the library.

namespace cfg {
   constexpr std::string_view VERTEX_LOOP_MAPPER        = "morphing.vertex_loop_mapper";
   constexpr std::string_view CLUSTERING_BALANCE        = "morphing.clustering.balance_clusters";
   constexpr std::string_view CLUSTERING_MAX_ITERATIONS = "morphing.clustering.max_iterations";
   constexpr std::string_view CLUSTERING_RANDOM_SEED    = "morphing.clustering.random_seed";
   constexpr std::string_view VERTEX_ALIGNMENT_NORM     = "morphing.vertex_alignment_norm";
   constexpr std::string_view ANGULAR_ALIGNMENT_NORM    = "morphing.angular_alignment_norm";
   constexpr std::string_view EUCLIDEAN_ALIGNMENT_NORM  = "morphing.euclidean_alignment_norm";
   constexpr std::string_view LOGGING_LEVEL             = "logging.level";
}

extern Config config(void);
extern void write_config(std::string_view Key, std::string_view Value);
extern ERR load_config(const std::string &Path);
extern void reset_config(void);
extern ERR apply_log_level(const Config &Source);

} // namespace
