#pragma once

#include <schemata/isa/opcode.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(schemata::isa,
                             opcode_t,
                             schemata::isa::opcode_t::fail,
                             schemata::isa::opcode_t::succ,
                             schemata::isa::opcode_t::jmp,
                             schemata::isa::opcode_t::jif,
                             schemata::isa::opcode_t::routine,
                             schemata::isa::opcode_t::ret,
                             schemata::isa::opcode_t::pcvs,
                             schemata::isa::opcode_t::pcas,
                             schemata::isa::opcode_t::pcps,
                             schemata::isa::opcode_t::pccs)
