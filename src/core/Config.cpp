#include "Config.h"

namespace wiz_scan {
static Config global_cfg;
Config& config(){ return global_cfg; }
void set_config(const Config& c){ global_cfg = c; }
}
