#include "config.hpp"

OutlineConfig OutlineConfig::defaults() {
  OutlineConfig config;
  config.patterns = defaultPatternTables();
  return config;
}
