#include"Escrow/LogSink.hpp"
#include"Escrow/Msg/Log.hpp"
#include"Ev/Io.hpp"
#include"Ev/now.hpp"
#include"Json/Out.hpp"
#include"S/Bus.hpp"
#include<iostream>

namespace Escrow {

LogSink::LogSink(S::Bus& bus, LogLevel threshold_)
	: LogSink(bus, threshold_, std::cerr) { }

LogSink::LogSink(S::Bus& bus, LogLevel threshold_, std::ostream& os_)
	: os(os_), threshold(threshold_) {
	bus.subscribe<Msg::Log>([this](Msg::Log const& m) {
		if (m.level < threshold)
			return Ev::lift();
		auto js = Json::Out()
			.start_object()
				.field("level", to_string(m.level))
				.field("time", Ev::now())
				.field("message", m.message)
			.end_object()
			;
		os << js.output() << std::endl;
		return Ev::lift();
	});
}

}
