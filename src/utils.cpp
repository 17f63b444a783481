#include "utils.hpp"
#include <arpa/inet.h>
#include <cstdlib>
#include <ctime>

static bool debug_on = false;

static void print_line(const char *color, const char *tag, const char *msg) {
    auto now = std::chrono::system_clock::now();
    std::time_t now_c = std::chrono::system_clock::to_time_t(now);
    struct tm parts;
    localtime_r(&now_c, &parts);
    auto microseconds = std::chrono::duration_cast<std::chrono::microseconds>(now.time_since_epoch()).count() % 1000000;
    printf("%s[%02d:%02d:%02d.%06ld] [%s] %s%s\n", color, parts.tm_hour, parts.tm_min, parts.tm_sec,
        static_cast<long>(microseconds), tag, msg, color[0] ? "\033[0m" : "");
    fflush(stdout);
}

// print log with green color, time(us) and [LOG] prefix
void log(const char *msg) {
    print_line("\033[32m", "LOG", msg);
}

// print warning with yellow color, time and [WRN] prefix
void warn(const char *msg) {
    print_line("\033[33m", "WRN", msg);
}

// print error with red color, time and [ERR] prefix
void err(const char *msg) {
    print_line("\033[31m", "ERR", msg);
    exit(1);
}

// print debug info with time and [DBG] prefix
void debug(const char *msg) {
    if (debug_on) {
        print_line("", "DBG", msg);
    }
}

void set_debug(bool on) {
    debug_on = on;
}

// get debug string of packet
// in format "prefix SYN/SYN+ACK/REQ/REQ+ACK/ACK/DAT len=xxx seq=xxx sum=xxx"
std::string get_debug_str(const char *prefix, const LiteFTPPacket *packet) {
    std::string ret = prefix;
    switch (packet->header.flags) {
        case TYPE_SYN:
            ret += " SYN";
            break;
        case TYPE_SYN | TYPE_ACK:
            ret += " SYN+ACK";
            break;
        case TYPE_REQ:
            ret += " REQ";
            break;
        case TYPE_ACK | TYPE_REQ:
            ret += " REQ+ACK";
            break;
        case TYPE_ACK:
            ret += " ACK";
            break;
        case TYPE_DATA:
            ret += " DAT";
            break;
        default:
            ret += " UNK";
            break;
    }
    ret += " len=";
    ret += std::to_string(packet->payload.size());
    ret += " seq=";
    ret += std::to_string(packet->header.seq);
    ret += " sum=";
    ret += std::to_string(packet->header.checksum);
    return ret;
}

std::string addr_str(const struct sockaddr_in &addr) {
    char buf[INET_ADDRSTRLEN] = {0};
    inet_ntop(AF_INET, &addr.sin_addr, buf, sizeof(buf));
    return std::string(buf) + ":" + std::to_string(ntohs(addr.sin_port));
}
