#ifndef ERRCODES_H
#define ERRCODES_H

#define ERR_HELP    1
#define ERR_OPT     2
#define ERR_RUNTIME 3
#define ERR_NOFILES 4
#define ERR_CANCEL  5

#endif //ERRCODES_H
