#include "dedrv.h"

#include "dedrv/singleton.h"

namespace dedrv {

LifecycleManager &manager() { return Singleton<LifecycleManager>::instance(); }

Report init() { return manager().init(); }

Report cleanup() { return manager().cleanup(); }

Optional<DeviceRef> find(const char *path) { return manager().find(path); }

} // namespace dedrv
