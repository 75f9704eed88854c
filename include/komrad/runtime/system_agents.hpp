// system_agents.hpp - built-in agents addressable by name from every program
#pragma once
#include "komrad/runtime/native_agent.hpp"
#include <memory>

namespace komrad {

std::shared_ptr<NativeAgent> make_io_agent(Runtime& rt);
std::shared_ptr<NativeAgent> make_fs_agent(Runtime& rt);
std::shared_ptr<NativeAgent> make_number_agent(Runtime& rt);
std::shared_ptr<NativeAgent> make_json_agent(Runtime& rt);
std::shared_ptr<NativeAgent> make_dict_agent(Runtime& rt);
std::shared_ptr<NativeAgent> make_list_agent(Runtime& rt);
std::shared_ptr<NativeAgent> make_assert_agent(Runtime& rt);

// Registers Io, Fs, Number, Json, Dict, List and Assert.
void install_system_agents(Runtime& rt);

} // namespace komrad
