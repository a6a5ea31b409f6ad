#include"S/Bus.hpp"
#include<unordered_map>

namespace S {

class Bus::Impl {
public:
	std::unordered_map< std::type_index
			  , std::unique_ptr<S::Detail::SignalBase>
			  > signals;
};

Bus::Bus() : pimpl(Util::make_unique<Impl>()) { }
Bus::Bus(Bus&&) =default;
Bus::~Bus() =default;

S::Detail::SignalBase* Bus::find(std::type_index key) const {
	auto it = pimpl->signals.find(key);
	if (it == pimpl->signals.end())
		return nullptr;
	return it->second.get();
}
S::Detail::SignalBase& Bus::add( std::type_index key
			       , std::unique_ptr<S::Detail::SignalBase> sig
			       ) {
	auto& slot = pimpl->signals[key];
	slot = std::move(sig);
	return *slot;
}

}
