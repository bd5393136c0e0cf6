/**
 * @file bindings.cpp
 * @brief pybind11 bindings for progspace.
 */

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "progspace/constants.hpp"
#include "progspace/insn_descriptor.hpp"
#include "progspace/placed_insn.hpp"
#include "progspace/program.hpp"
#include "progspace/random_source.hpp"

namespace py = pybind11;
using namespace progspace;

namespace {

// pybind11 holders can't carry a pointer-to-const, so descriptors cross
// the boundary as shared_ptr<InsnDescriptor>. Python never mutates them.
std::shared_ptr<InsnDescriptor> to_py(std::shared_ptr<const InsnDescriptor> desc) {
    return std::const_pointer_cast<InsnDescriptor>(std::move(desc));
}

using PortableTuple = std::pair<std::string, std::vector<uint32_t>>;

}  // namespace

PYBIND11_MODULE(progspace, m) {
    m.doc() = "Instruction memory layout and branch-target placement";

    // Export constants
    m.attr("INSN_BYTES") = INSN_BYTES;
    m.attr("DEFAULT_IMEM_BYTES") = DEFAULT_IMEM_BYTES;
    m.attr("MNEMONIC_COLUMN") = MNEMONIC_COLUMN;

    // Program configuration
    py::class_<Program::Config>(m, "ProgramConfig")
        .def(py::init<>())
        .def_readwrite("imem_size", &Program::Config::imem_size,
                       "Size of IMEM in bytes (default: 4 KiB)")
        .def_readwrite("trace", &Program::Config::trace,
                       "Trace layout changes to stderr (default: false)");

    // Program statistics
    py::class_<Program::Stats>(m, "ProgramStats")
        .def_readonly("sections_opened", &Program::Stats::sections_opened)
        .def_readonly("merges", &Program::Stats::merges)
        .def_readonly("insns_added", &Program::Stats::insns_added)
        .def_readonly("targets_picked", &Program::Stats::targets_picked)
        .def_readonly("pick_failures", &Program::Stats::pick_failures)
        .def("__repr__", [](const Program::Stats& s) {
            return "ProgramStats(sections_opened=" + std::to_string(s.sections_opened) +
                   ", merges=" + std::to_string(s.merges) +
                   ", insns_added=" + std::to_string(s.insns_added) +
                   ", targets_picked=" + std::to_string(s.targets_picked) +
                   ", pick_failures=" + std::to_string(s.pick_failures) + ")";
        });

    py::class_<RandomSource>(m, "RandomSource")
        .def(py::init<uint64_t>(), py::arg("seed"))
        .def("random", &RandomSource::random,
             "Uniform float in [0, 1)")
        .def("choice", &RandomSource::choice, py::arg("weights"),
             "Index chosen with probability proportional to its weight")
        .def("reseed", &RandomSource::reseed, py::arg("seed"))
        .def_property_readonly("seed", &RandomSource::seed)
        .def_property_readonly("draws", &RandomSource::draws);

    // ========================================================================
    // Instruction descriptors
    // ========================================================================
    py::enum_<LsuKind>(m, "LsuKind")
        .value("Load", LsuKind::Load)
        .value("Store", LsuKind::Store);

    py::class_<OperandSpec>(m, "OperandSpec")
        .def(py::init<std::string, std::string>(),
             py::arg("name"),
             py::arg("reg_prefix") = "")
        .def_readonly("name", &OperandSpec::name)
        .def_readonly("reg_prefix", &OperandSpec::reg_prefix)
        .def_property_readonly("is_register", &OperandSpec::is_register);

    py::class_<InsnDescriptor, std::shared_ptr<InsnDescriptor>>(m, "InsnDescriptor")
        .def(py::init<std::string, std::vector<OperandSpec>, std::string, bool,
                      std::optional<LsuKind>>(),
             py::arg("mnemonic"),
             py::arg("operands"),
             py::arg("syntax"),
             py::arg("glued_ops") = false,
             py::arg("lsu") = py::none())
        .def_property_readonly("mnemonic", &InsnDescriptor::mnemonic)
        .def_property_readonly("operands", &InsnDescriptor::operands)
        .def_property_readonly("syntax", &InsnDescriptor::syntax)
        .def_property_readonly("glued_ops", &InsnDescriptor::glued_ops)
        .def_property_readonly("lsu", &InsnDescriptor::lsu)
        .def("render_vals", &InsnDescriptor::render_vals, py::arg("vals"),
             "Render a dict of operand values through the syntax");

    py::class_<InsnCatalog>(m, "InsnCatalog")
        .def(py::init<>())
        .def("add",
             [](InsnCatalog& catalog, const InsnDescriptor& desc) {
                 return to_py(catalog.add(desc));
             },
             py::arg("desc"),
             "Register a descriptor and return the catalog's copy")
        .def("lookup",
             [](const InsnCatalog& catalog, const std::string& mnemonic) {
                 return to_py(catalog.lookup(mnemonic));
             },
             py::arg("mnemonic"))
        .def("__contains__", &InsnCatalog::contains)
        .def("__len__", &InsnCatalog::size);

    // ========================================================================
    // Placed instructions
    // ========================================================================
    py::class_<MemAccess>(m, "MemAccess")
        .def(py::init<std::string, uint32_t>(), py::arg("mem_type"), py::arg("addr"))
        .def_readonly("mem_type", &MemAccess::mem_type)
        .def_readonly("addr", &MemAccess::addr);

    py::class_<PlacedInsn>(m, "PlacedInsn")
        .def(py::init([](std::shared_ptr<InsnDescriptor> insn,
                         std::vector<uint32_t> operands,
                         std::optional<MemAccess> mem_access) {
                 return PlacedInsn(std::move(insn), std::move(operands),
                                   std::move(mem_access));
             }),
             py::arg("insn"),
             py::arg("operands"),
             py::arg("mem_access") = py::none())
        .def_static("from_portable",
             [](const PortableTuple& portable, const InsnCatalog& catalog,
                std::optional<MemAccess> mem_access) {
                 return PlacedInsn::from_portable(
                     PortableInsn{portable.first, portable.second}, catalog,
                     std::move(mem_access));
             },
             py::arg("portable"),
             py::arg("catalog"),
             py::arg("mem_access") = py::none())
        .def_property_readonly("insn",
             [](const PlacedInsn& pi) { return to_py(pi.insn_ptr()); })
        .def_property_readonly("operands", &PlacedInsn::operands)
        .def_property_readonly("mem_access", &PlacedInsn::mem_access)
        .def("to_portable",
             [](const PlacedInsn& pi) {
                 PortableInsn p = pi.to_portable();
                 return PortableTuple(std::move(p.mnemonic), std::move(p.operands));
             },
             "Snapshot as a (mnemonic, operands) tuple")
        .def("to_asm", &PlacedInsn::to_asm);

    // ========================================================================
    // Program layout
    // ========================================================================
    py::class_<Section>(m, "Section")
        .def_readonly("base", &Section::base)
        .def_readonly("insns", &Section::insns)
        .def_property_readonly("end", &Section::end);

    py::class_<OpenSection>(m, "OpenSection")
        .def_property_readonly("insns_left", &OpenSection::insns_left)
        .def_property_readonly("insns", &OpenSection::insns);

    py::class_<Program>(m, "Program")
        .def(py::init<const Program::Config&>(),
             py::arg("config"),
             "Create an empty program with the given configuration")

        .def("open_section", &Program::open_section, py::arg("addr"),
             "Start a new section at addr, closing any current one")

        .def("close_section", &Program::close_section,
             "Finalize any current section")

        .def("get_cur_section",
             [](const Program& program) -> std::optional<OpenSection> {
                 const OpenSection* section = program.cur_section();
                 if (!section) {
                     return std::nullopt;
                 }
                 return *section;
             },
             "Copy of the section being added to, or None")

        .def("append_insns", &Program::append_insns, py::arg("insns"),
             "Append instructions to the current section")

        .def("add_insns", &Program::add_insns,
             py::arg("addr"),
             py::arg("insns"),
             "Add a sequence of instructions, starting at addr")

        .def("get_insn_space_at", &Program::get_insn_space_at, py::arg("addr"),
             "Number of instructions there is room for at addr")

        .def("pick_branch_targets", &Program::pick_branch_targets,
             py::arg("rng"),
             py::arg("min_len"),
             py::arg("count"),
             py::arg("tgt_min") = py::none(),
             py::arg("tgt_max") = py::none(),
             "Pick count branch targets, or None if there isn't room")

        .def("pick_branch_target", &Program::pick_branch_target,
             py::arg("rng"),
             py::arg("min_len"),
             py::arg("tgt_min") = py::none(),
             py::arg("tgt_max") = py::none(),
             "Pick a single branch target, or None if there isn't room")

        .def("dump_asm",
             [](Program& program) {
                 std::ostringstream oss;
                 program.dump_asm(oss);
                 return oss.str();
             },
             "Assembly listing of the program (closes the current section)")

        .def("finalize", &Program::finalize,
             "Close the current section and return all sections by base")

        .def("stats", &Program::stats,
             "Get layout statistics")

        .def("reset_stats", &Program::reset_stats,
             "Reset layout statistics")

        .def_property_readonly("imem_size", &Program::imem_size);
}
