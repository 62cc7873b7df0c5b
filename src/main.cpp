#include "uci.h"

int main() {
    uci_loop();
    return 0;
}
