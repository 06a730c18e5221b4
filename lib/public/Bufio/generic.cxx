#include <Bufio/generic.hxx>

using namespace Bufio;

Generic::~Generic() noexcept {}
