#include "src/wait_group.h"

#include "src/wake_channel.h"

namespace waitgroup {

template class WaitGroupImpl<FutexWakeChannel>;

}  // namespace waitgroup
