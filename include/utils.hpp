#ifndef UTILS_HPP
#define UTILS_HPP

#include <iostream>
#include <cstdio>
#include <chrono>
#include <string>
#include <netinet/in.h>
#include "protocol.hpp"

// print log
void log(const char *msg);

// print recoverable error
void warn(const char *msg);

// print error and exit
void err(const char *msg);

// print debug info
void debug(const char *msg);

// turn debug output on or off
void set_debug(bool on);

std::string get_debug_str(const char *prefix, const LiteFTPPacket *packet);

// "a.b.c.d:port"
std::string addr_str(const struct sockaddr_in &addr);
#endif
