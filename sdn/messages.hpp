#ifndef __SDN_MESSAGES_HPP__
#define __SDN_MESSAGES_HPP__

// ONLY USEFUL AFTER RUNNING PROTOC.
#include <sdn/messages.pb.h>

#endif // __SDN_MESSAGES_HPP__
