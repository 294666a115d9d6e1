#pragma once

#include "notes/model/Note.hpp"

#include <vector>

namespace nb::notes { class Store; }

namespace nb::seed {

// Deterministic placeholder notes, numbered from 1.
std::vector<notes::model::NoteDraft> sampleDrafts(unsigned int count);

// Returns the number of notes created.
unsigned int seed(notes::Store& store, unsigned int count);

void reset(notes::Store& store);

}
