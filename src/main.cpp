#include <cstdlib>
#include <iostream>
#include <stdexcept>

#include "gridact/action/action_codec.hpp"
#include "gridact/action/action_state.hpp"
#include "gridact/schema/grid_schema.hpp"
#include "gridact/schema/schema_yaml.hpp"

namespace
{

void print_counts(const gridact::GridSchema& schema)
{
    std::cout << "grid: " << (schema.env_name().empty() ? "<unnamed>" : schema.env_name()) << "\n"
              << "  substations:   " << schema.n_sub() << "\n"
              << "  loads:         " << schema.n_load() << "\n"
              << "  generators:    " << schema.n_gen() << "\n"
              << "  powerlines:    " << schema.n_line() << "\n"
              << "  storage units: " << schema.n_storage() << "\n"
              << "  shunts:        " << schema.n_shunt() << "\n"
              << "  dim_topo:      " << schema.dim_topo() << "\n";
}

void print_topology(const gridact::GridSchema& schema)
{
    std::cout << "\ntopology:\n";
    for (gridact::SubIdx sub = 0; sub < schema.n_sub(); ++sub)
    {
        std::cout << "  " << schema.names(gridact::ObjectKind::Substation)[sub] << " [" << schema.sub_start(sub)
                  << ", " << schema.sub_start(sub) + schema.sub_info()[sub] << "):";
        const auto start = schema.sub_start(sub);
        for (size_t local = 0; local < schema.sub_info()[sub]; ++local)
        {
            const auto [kind, id] = schema.element_at(start + local);
            std::cout << " " << gridact::to_string(kind) << " " << id << ";";
        }
        std::cout << "\n";
    }
}

void print_layout(const gridact::ActionState& action)
{
    std::cout << "\nflat layout of a " << gridact::to_string(action.profile())
              << " action (size " << action.capabilities().vector_size() << "):\n";
    for (const auto& slice : action.capabilities().layout())
    {
        std::cout << "  " << gridact::to_string(slice.attribute) << " @" << slice.offset << " x" << slice.length
                  << "\n";
    }
    const auto vect = gridact::ActionCodec::to_vect(action);
    std::cout << "  encoded do-nothing action: " << vect.size() << " values\n";
}

} // namespace

int main(int argc, char** argv)
{
    if (argc != 2)
    {
        std::cerr << "usage: " << (argc > 0 ? argv[0] : "gridact") << " <grid.yaml>\n";
        return EXIT_FAILURE;
    }
    try
    {
        auto schema = gridact::GridSchema::create(gridact::load_grid_description_file(argv[1]));
        print_counts(*schema);
        print_topology(*schema);
        print_layout(gridact::ActionState(schema, gridact::ActionProfile::Complete));
    }
    catch (const std::exception& e)
    {
        std::cerr << "\nError:\n" << e.what() << "\n" << std::flush;
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
