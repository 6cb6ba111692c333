#ifndef GRAPHTRANSLITERATOR_VERSION_H
#define GRAPHTRANSLITERATOR_VERSION_H

// Set by the build; stamped into every built transliterator
#ifndef GRAPHTRANSLITERATOR_VERSION
#define GRAPHTRANSLITERATOR_VERSION "0.0.0"
#endif

#endif // GRAPHTRANSLITERATOR_VERSION_H
