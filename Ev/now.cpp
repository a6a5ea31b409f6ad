#include"Ev/now.hpp"
#include<ev.h>

namespace Ev {

double now() {
	return ev_time();
}
std::uint64_t now_ms() {
	return std::uint64_t(ev_time() * 1000);
}

}
