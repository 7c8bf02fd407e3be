#pragma once
#include <sbdump/dataset.hpp>

#include <ostream>

namespace sbdump {

// Header line and MD5 always; chunk lists and every record when verbose.
void print_list(std::ostream &out, const ListDataset &ds, bool verbose);

} // namespace sbdump
