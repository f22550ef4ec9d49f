#ifndef VERSION_H
#define VERSION_H

#define VERSION_STRING "v1.2"

#endif //VERSION_H
