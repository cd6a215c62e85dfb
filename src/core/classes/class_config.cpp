/*********************************************************************************************************************

The source code of the Morphic project is made publicly available under the terms described in the LICENSE.TXT file
that is distributed with this package.  Please refer to it for further information on licensing.

**********************************************************************************************************************

-CLASS-
Config: Manages the reading and writing of configuration values.

The Config class holds text based key-values in a simple grouped format.  The following segment illustrates:

<pre>
[morphing]
vertex_loop_mapper = "clustering"
vertex_alignment_norm = l1

[morphing.clustering]
balance_clusters = true
max_iterations = 50
random_seed = 42

[logging]
level = warning
</pre>

Text enclosed in square brackets names a 'group'.  Keys within the group are expressed as strings; quotes around a
value are stripped.  Lines starting with `#` are comments.

Values can be addressed with a dotted key, in which case the group is everything before the last dot.  For instance
`morphing.clustering.max_iterations` reads the `max_iterations` key of group `morphing.clustering`.

A process-wide instance is pre-loaded with the library defaults.  `mx::config()` returns a snapshot of it and
`mx::write_config()` updates a single value; both are safe to call while another thread reloads the configuration.

-END-

*********************************************************************************************************************/

#include <stdio.h>
#include <string.h>
#include <strings.h>
#include <cstdlib>
#include "../defs.h"

namespace mx {

static const char glDefaults[] =
   "[morphing]\n"
   "vertex_loop_mapper = \"clustering\"\n"
   "vertex_alignment_norm = \"l1\"\n"
   "\n"
   "[morphing.clustering]\n"
   "balance_clusters = true\n"
   "max_iterations = 50\n"
   "random_seed = 42\n"
   "\n"
   "[logging]\n"
   "level = \"warning\"\n";

static bool check_for_key(CSTRING);

//********************************************************************************************************************

template <class T>
T next_line(T Data)
{
   while ((*Data != '\n') and (*Data)) Data++;
   while ((*Data) and (*Data <= 0x20)) Data++; // Skip empty lines and any leading whitespace
   return Data;
}

//********************************************************************************************************************
// Searches for the next group in a text buffer, returns its name and the start of the first key value.

template <class T>
T next_group(T Data, std::string &GroupName)
{
   while (*Data) {
      if (*Data IS '[') {
         int len;
         for (len=1; (Data[len] != '\n') and (Data[len]); len++) {
            if (Data[len] IS '[') break; // Invalid character check
            if (Data[len] IS ']') {
               GroupName.assign(Data, 1, len-1);
               return next_line(Data+len); // Skip all trailing characters to reach the next line
            }
         }
         Data += len;
      }
      Data = next_line(Data);
   }
   return Data;
}

//********************************************************************************************************************
// Splits "a.b.c" into group "a.b" and key "c".  Returns false if there is no group component.

static bool split_key(std::string_view Key, std::string_view &Group, std::string_view &Name)
{
   auto dot = Key.rfind('.');
   if ((dot IS std::string_view::npos) or (dot IS 0) or (dot+1 >= Key.size())) return false;
   Group = Key.substr(0, dot);
   Name  = Key.substr(dot+1);
   return true;
}

//********************************************************************************************************************

static ConfigGroup * find_group(ConfigGroups &Groups, std::string_view GroupName)
{
   for (auto &group : Groups) {
      if (group.first IS GroupName) return &group;
   }
   return nullptr;
}

/*********************************************************************************************************************

-METHOD-
Parse: Parses a configuration text buffer and adds its values to the object.

Values that already exist are overwritten.  Groups are created on demand.

-ERRORS-
Okay
NoData: The buffer is empty.

*********************************************************************************************************************/

ERR Config::parse(std::string_view Text)
{
   Log log("Config");

   if (Text.empty()) return ERR::NoData;

   log.traceBranch("%.20s", std::string(Text.substr(0, 20)).c_str());

   std::string buffer(Text); // Guarantees termination for the scanner
   std::string group_name;
   CSTRING data = next_group(buffer.c_str(), group_name); // Find the first group

   while ((data) and (*data)) {
      while ((*data) and (*data <= 0x20)) data++;
      if (*data IS '#') { // Commented
         data = next_line(data);
         continue;
      }

      ConfigGroup *current_group = nullptr;
      while ((*data) and (*data != '[')) { // Keep processing keys until either a new group or EOF is reached
         if (check_for_key(data)) {
            std::string key, value;

            int len;
            for (len=0; (data[len]) and (data[len] != '='); len++);
            if (!data[len]) break;
            while ((len > 0) and (data[len-1] <= 0x20)) len--;
            key.assign(data, 0, len);
            data += len;

            while ((*data) and (*data != '=')) data++;
            if (*data) data++;
            while ((*data) and (*data != '\n') and (*data <= 0x20)) data++;

            if (*data IS '"') {
               data++;
               for (len=0; (data[len]) and (data[len] != '"') and (data[len] != '\n'); len++);
               value.assign(data, 0, len);
               data += len;
            }
            else {
               for (len=0; (data[len]) and (data[len] != '\n') and (data[len] != '\r'); len++);
               while ((len > 0) and (data[len-1] <= 0x20)) len--;
               value.assign(data, 0, len);
               data += len;
            }
            data = next_line(data);

            if (!current_group) { // Check if a matching group already exists before creating a new one
               current_group = mx::find_group(groups, group_name);
               if (!current_group) {
                  current_group = &groups.emplace_back();
                  current_group->first = group_name;
               }
            }
            current_group->second[key] = value;
         }
         else data = next_line(data);
      }
      data = next_group(data, group_name);
   }

   return ERR::Okay;
}

/*********************************************************************************************************************

-METHOD-
Load: Reads a configuration file and merges its values into the object.

-ERRORS-
Okay
NullArgs
File: The file could not be opened or read.

*********************************************************************************************************************/

ERR Config::load(const std::string &Path)
{
   Log log("Config");

   if (Path.empty()) return log.warning(ERR::NullArgs);

   log.branch("%s", Path.c_str());

   auto fd = fopen(Path.c_str(), "rb");
   if (!fd) {
      log.warning("Failed to open \"%s\"", Path.c_str());
      return ERR::File;
   }

   std::string content;
   char buffer[4096];
   size_t len;
   while ((len = fread(buffer, 1, sizeof(buffer), fd)) > 0) content.append(buffer, len);
   bool failed = ferror(fd);
   fclose(fd);

   if (failed) return log.warning(ERR::File);
   if (content.empty()) return ERR::Okay;
   return parse(content);
}

/*********************************************************************************************************************

-METHOD-
Merge: Merges the values of another config object.

Keys in the source overwrite those in the destination.  Source groups that do not exist in the destination are
appended.

*********************************************************************************************************************/

void Config::merge(const Config &Source)
{
   for (auto &[src_group, src_keys] : Source.groups) {
      bool processed = false;

      // Check if the group already exists and merge the keys

      for (auto &[dest_group, dest_keys] : groups) {
         if (dest_group IS src_group) {
            processed = true;
            for (auto &[k, v] : src_keys) {
               dest_keys[k] = v;
            }
         }
      }

      if (!processed) { // New group to be added
         auto &new_group = groups.emplace_back();
         new_group.first  = src_group;
         new_group.second = src_keys;
      }
   }
}

//********************************************************************************************************************

const ConfigKeys * Config::find_group(std::string_view Group) const
{
   for (auto &group : groups) {
      if (group.first IS Group) return &group.second;
   }
   return nullptr;
}

//********************************************************************************************************************

ERR Config::read(std::string_view Group, std::string_view Key, std::string &Value) const
{
   if (auto keys = find_group(Group)) {
      if (auto it = keys->find(Key); it != keys->end()) {
         Value = it->second;
         return ERR::Okay;
      }
   }
   return ERR::Search;
}

ERR Config::read(std::string_view Key, std::string &Value) const
{
   std::string_view group, name;
   if (!split_key(Key, group, name)) return ERR::InvalidValue;
   return read(group, name, Value);
}

//********************************************************************************************************************

void Config::write(std::string_view Group, std::string_view Key, std::string_view Value)
{
   auto group = mx::find_group(groups, Group);
   if (!group) {
      group = &groups.emplace_back();
      group->first = Group;
   }
   group->second.insert_or_assign(std::string(Key), std::string(Value));
}

void Config::write(std::string_view Key, std::string_view Value)
{
   Log log("Config");
   std::string_view group, name;
   if (split_key(Key, group, name)) write(group, name, Value);
   else log.warning("Key '%.*s' has no group component.", int(Key.size()), Key.data());
}

//********************************************************************************************************************

bool Config::contains(std::string_view Key) const
{
   std::string value;
   return read(Key, value) IS ERR::Okay;
}

std::string Config::get_string(std::string_view Key, std::string_view Default) const
{
   std::string value;
   if (read(Key, value) IS ERR::Okay) return value;
   return std::string(Default);
}

//********************************************************************************************************************
// Non-numeric values are reported and the default is returned.

int Config::get_int(std::string_view Key, int Default) const
{
   Log log("Config");

   std::string value;
   if (read(Key, value) != ERR::Okay) return Default;

   char *end = nullptr;
   auto result = strtol(value.c_str(), &end, 0);
   if ((end IS value.c_str()) or (*end)) {
      log.warning("Value '%s' of key '%.*s' is not an integer.", value.c_str(), int(Key.size()), Key.data());
      return Default;
   }
   return int(result);
}

bool Config::get_bool(std::string_view Key, bool Default) const
{
   Log log("Config");

   std::string value;
   if (read(Key, value) != ERR::Okay) return Default;

   auto str = value.c_str();
   if ((!strcasecmp(str, "true")) or (!strcasecmp(str, "yes")) or (!strcasecmp(str, "on")) or (!strcmp(str, "1"))) return true;
   if ((!strcasecmp(str, "false")) or (!strcasecmp(str, "no")) or (!strcasecmp(str, "off")) or (!strcmp(str, "0"))) return false;

   log.warning("Value '%s' of key '%.*s' is not a boolean.", str, int(Key.size()), Key.data());
   return Default;
}

//********************************************************************************************************************
// Checks the next line in a buffer to see if it is a valid key.

static bool check_for_key(CSTRING Data)
{
   if ((*Data != '\n') and (*Data != '\r') and (*Data != '[') and (*Data != '#')) {
      while ((*Data) and (*Data != '\n') and (*Data != '\r') and (*Data != '=')) Data++; // Skip key name
      if (*Data != '=') return false;
      return true;
   }

   return false;
}

//********************************************************************************************************************
// Process-wide configuration.  Initialised with the library defaults on first use.

static std::mutex glConfigLock;

static Config & global_config(void)
{
   static Config glConfig = []() {
      Config defaults;
      if (defaults.parse(glDefaults) != ERR::Okay) Log("Config").error("Failed to parse the default configuration.");
      return defaults;
   }();
   return glConfig;
}

Config config(void)
{
   std::lock_guard lock(glConfigLock);
   return global_config();
}

//********************************************************************************************************************

void write_config(std::string_view Key, std::string_view Value)
{
   std::lock_guard lock(glConfigLock);
   global_config().write(Key, Value);
}

/*********************************************************************************************************************

-FUNCTION-
load_config: Merges a configuration file into the process-wide configuration.

The log level is updated if the file defines `logging.level`.

-INPUT-
cpp(str) Path: Path to the configuration file.

-ERRORS-
Okay
NullArgs
File

*********************************************************************************************************************/

ERR load_config(const std::string &Path)
{
   Config file;
   if (auto error = file.load(Path); error != ERR::Okay) return error;

   std::lock_guard lock(glConfigLock);
   auto &global = global_config();
   global.merge(file);
   if (file.contains(cfg::LOGGING_LEVEL)) return apply_log_level(global);
   return ERR::Okay;
}

//********************************************************************************************************************
// Reverts the process-wide configuration to the library defaults.

void reset_config(void)
{
   std::lock_guard lock(glConfigLock);
   auto &global = global_config();
   global.clear();
   if (global.parse(glDefaults) != ERR::Okay) Log(__FUNCTION__).error("Failed to parse the default configuration.");
}

//********************************************************************************************************************

ERR apply_log_level(const Config &Source)
{
   Log log(__FUNCTION__);

   std::string value;
   if (Source.read(cfg::LOGGING_LEVEL, value) != ERR::Okay) return ERR::Okay;

   int level;
   if (ParseLogLevel(value.c_str(), level) != ERR::Okay) {
      log.warning("Unrecognised log level '%s'", value.c_str());
      return ERR::InvalidValue;
   }

   SetLogLevel(level);
   return ERR::Okay;
}

} // namespace
