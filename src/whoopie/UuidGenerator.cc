#include "whoopie/UuidGenerator.hh"

namespace Whoopie {

Uuid generateUuid()
{
    static UuidGenerator uuidGenerator {&getRng()};
    return uuidGenerator();
}

}
