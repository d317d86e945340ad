#include "skykernel/seed/dictionary.hpp"
#include <fmt/core.h>
#include <string>

namespace skykernel::seed {
    namespace {
        constexpr WordList WORDS = {
            "abbey", "ablaze", "abort", "absorb", "abyss", "aces", "aching", "acidic",
            "across", "acumen", "adapt", "adept", "adjust", "adopt", "adult", "aerial",
            "afar", "affair", "afield", "afloat", "afoot", "afraid", "after", "agenda",
            "agile", "aglow", "agony", "agreed", "ahead", "aided", "aisle", "ajar",
            "akin", "alarms", "album", "alerts", "alley", "almost", "aloof", "alpine",
            "also", "alumni", "always", "amaze", "ambush", "amidst", "ammo", "among",
            "amply", "amused", "anchor", "angled", "ankle", "antics", "anvil", "apart",
            "apex", "aphid", "aplomb", "apply", "archer", "ardent", "arena", "argue",
            "arises", "army", "around", "arrow", "ascend", "aside", "asked", "asleep",
            "aspire", "asylum", "atlas", "atom", "atrium", "attire", "auburn", "audio",
            "august", "aunt", "autumn", "avatar", "avidly", "avoid", "awful", "awning",
            "awoken", "axes", "axis", "axle", "aztec", "azure", "baby", "bacon",
            "badge", "bailed", "bakery", "bamboo", "banjo", "basin", "batch", "bawled",
            "bays", "beer", "befit", "begun", "behind", "being", "below", "bested",
            "bevel", "beware", "beyond", "bias", "bids", "bikini", "birth", "bite",
            "blip", "boat", "bodies", "bogeys", "boil", "boldly", "bomb", "border",
            "boss", "both", "bovine", "boxes", "broken", "brunt", "bubble", "budget",
            "buffet", "bugs", "bulb", "bumper", "bunch", "butter", "buying", "buzzer",
            "byline", "bypass", "cabin", "cactus", "cadets", "cafe", "cage", "cajun",
            "cake", "camp", "candy", "casket", "catch", "cause", "cease", "cedar",
            "cell", "cement", "cent", "chrome", "cider", "cigar", "cinema", "circle",
            "cistern", "citadel", "civilian", "claim", "click", "clue", "coal", "cobra",
            "cocoa", "code", "coffee", "cogs", "coils", "colony", "comb", "cool",
            "copy", "cousin", "cowl", "cube", "cuffs", "custom", "cuts", "dabbing",
            "daft", "dagger", "daily", "damp", "dapper", "darted", "dash", "dating",
            "dawn", "dazed", "debut", "decay", "deftly", "deity", "dented", "depth",
            "desk", "devoid", "dice", "diet", "digit", "dilute", "dime", "dinner",
            "diode", "ditch", "divers", "dizzy", "doctor", "dodge", "does", "dogs",
            "doing", "donuts", "dosage", "dotted", "double", "dove", "down", "dozen",
            "dreams", "drinks", "drunk", "drying", "dual", "dubbed", "dude", "duets",
            "duke", "dummy", "dunes", "duplex", "dusted", "duties", "dwarf", "dwelt",
            "dying", "earth", "eavesdrop", "ecology", "eden", "edgy", "edited", "educated",
            "eels", "efficient", "eggs", "egotistic", "eight", "either", "eject", "elapse",
            "elbow", "eldest", "eleven", "elite", "elope", "else", "eluded", "emails",
            "ember", "emerge", "emit", "empty", "energy", "enigma", "enjoy", "enlist",
            "enmity", "enough", "ensign", "envy", "epoxy", "equip", "erase", "error",
            "estate", "etched", "ethics", "excess", "exhale", "exit", "exotic", "extra",
            "exult", "fading", "faked", "fall", "family", "fancy", "fatal", "faulty",
            "fawns", "faxed", "fazed", "feast", "feel", "feline", "fences", "ferry",
            "fever", "fewest", "fiat", "fibula", "fidget", "fierce", "fight", "films",
            "firm", "five", "fixate", "fizzle", "fleet", "flying", "foamy", "focus",
            "foes", "foggy", "foiled", "fonts", "fossil", "fowls", "foxes", "foyer",
            "framed", "frown", "fruit", "frying", "fudge", "fuel", "fully", "fuming",
            "fungal", "future", "fuzzy", "gables", "gadget", "gags", "gained", "galaxy",
            "gambit", "gang", "gasp", "gather", "gauze", "gave", "gawk", "gaze",
            "gecko", "geek", "gels", "germs", "geyser", "ghetto", "ghost", "giant",
            "giddy", "gifts", "gills", "ginger", "girth", "giving", "glass", "glide",
            "gnaw", "gnome", "goat", "goblet", "goes", "going", "gone", "gopher",
            "gossip", "gotten", "gown", "grunt", "guest", "guide", "gulp", "guru",
            "gusts", "gutter", "guys", "gymnast", "gypsy", "gyrate", "habitat", "hacksaw",
            "haggled", "hairy", "hamburger", "happens", "hashing", "hatchet", "haunted", "having",
            "hawk", "haystack", "hazard", "hectare", "hedgehog", "heels", "hefty", "height",
            "hemlock", "hence", "heron", "hesitate", "hexagon", "hickory", "hiding", "highway",
            "hijack", "hiker", "hills", "himself", "hinder", "hippo", "hire", "history",
            "hitched", "hive", "hoax", "hobby", "hockey", "hoisting", "hold", "honked",
            "hookup", "hope", "hornet", "hospital", "hotel", "hounded", "hover", "howls",
            "hubcaps", "huddle", "huge", "hull", "humid", "hunter", "hurried", "husband",
            "huts", "hybrid", "hydrogen", "hyper", "iceberg", "icing", "icon", "identity",
            "idiom", "idled", "idols", "igloo", "ignore", "iguana", "illness", "imagine",
            "imbalance", "imitate", "impel", "inactive", "inbound", "incur", "industrial", "inexact",
            "inflamed", "ingested", "initiate", "injury", "inkling", "inline", "inmate", "innocent",
            "inorganic", "input", "inquest", "inroads", "insult", "intended", "inundate", "invoke",
            "inwardly", "ionic", "irate", "iris", "irony", "irritate", "island", "isolated",
            "issued", "italics", "itches", "items", "itinerary", "itself", "ivory", "jabbed",
            "jackets", "jaded", "jagged", "jailed", "jamming", "january", "jargon", "jaunt",
            "javelin", "jaws", "jazz", "jeans", "jeers", "jellyfish", "jeopardy", "jerseys",
            "jester", "jetting", "jewels", "jigsaw", "jingle", "jittery", "jive", "jobs",
            "jockey", "jogger", "joining", "joking", "jolted", "jostle", "journal", "joyous",
            "jubilee", "judge", "juggled", "juicy", "jukebox", "july", "jump", "junk",
            "jury", "justice", "juvenile", "kangaroo", "karate", "keep", "kennel", "kept",
            "kernels", "kettle", "keyboard", "kickoff", "kidneys", "king", "kiosk", "kisses",
            "kitchens", "kiwi", "knapsack", "knee", "knife", "knowledge", "knuckle", "koala",
            "laboratory", "ladder", "lagoon", "lair", "lakes", "lamb", "language", "laptop",
            "large", "last", "later", "launching", "lava", "lawsuit", "layout", "lazy",
            "lectures", "ledge", "leech", "left", "legion", "leisure", "lemon", "lending",
            "leopard", "lesson", "lettuce", "lexicon", "liar", "library", "licks", "lids",
            "lied", "lifestyle", "light", "likewise", "lilac", "limits", "linen", "lion",
            "lipstick", "liquid", "listen", "lively", "loaded", "lobster", "locker", "lodge",
            "lofty", "logic", "loincloth", "long", "looking", "lopped", "lordship", "losing",
            "lottery", "loudly", "love", "lower", "loyal", "lucky", "luggage", "lukewarm",
            "lullaby", "lumber", "lunar", "lurk", "lush", "luxury", "lymph", "lynx",
            "lyrics", "macro", "madness", "magically", "mailed", "major", "makeup", "malady",
            "mammal", "maps", "masterful", "match", "maul", "maverick", "maximum", "mayor",
            "maze", "meant", "mechanic", "medicate", "meeting", "megabyte", "melting", "memoir",
            "menu", "merger", "mesh", "metro", "mews", "mice", "midst", "mighty",
            "mime", "mirror", "misery", "mittens", "mixture", "moat", "mobile", "mocked",
            "mohawk", "moisture", "molten", "moment", "money", "moon", "mops", "morsel",
            "mostly", "motherly", "mouth", "movement", "mowing", "much", "muddy", "muffin",
            "mugged", "mullet", "mumble", "mundane", "muppet", "mural", "musical", "muzzle",
            "myriad", "mystery", "myth", "nabbing", "nagged", "nail", "names", "nanny",
            "napkin", "narrate", "nasty", "natural", "nautical", "navy", "nearby", "necklace",
            "needed", "negative", "neither", "neon", "nephew", "nerves", "nestle", "network",
            "neutral", "never", "newt", "nexus", "nibs", "niche", "niece", "nifty",
            "nightly", "nimbly", "nineteen", "nirvana", "nitrogen", "nobody", "nocturnal", "nodes",
            "noises", "nomad", "noodles", "northern", "nostril", "noted", "nouns", "novelty",
            "nowhere", "nozzle", "nuance", "nucleus", "nudged", "nugget", "nuisance", "null",
            "number", "nuns", "nurse", "nutshell", "nylon", "oaks", "oars", "oasis",
            "oatmeal", "obedient", "object", "obliged", "obnoxious", "observant", "obtains", "obvious",
            "occur", "ocean", "october", "odds", "odometer", "offend", "often", "oilfield",
            "ointment", "okay", "older", "olive", "olympics", "omega", "omission", "omnibus",
            "onboard", "oncoming", "oneself", "ongoing", "onion", "online", "onslaught", "onto",
            "onward", "oozed", "opacity", "opened", "opposite", "optical", "opus", "orange",
            "orbit", "orchid", "orders", "organs", "origin", "ornament", "orphans", "oscar",
            "ostrich", "otherwise", "otter", "ouch", "ought", "ounce", "ourselves", "oust",
            "outbreak", "oval", "oven", "owed", "owls", "owner", "oxidant", "oxygen",
            "oyster", "ozone", "pact", "paddles", "pager", "pairing", "palace", "pamphlet",
            "pancakes", "paper", "paradise", "pastry", "patio", "pause", "pavements", "pawnshop",
            "payment", "peaches", "pebbles", "peculiar", "pedantic", "peeled", "pegs", "pelican",
            "pencil", "people", "pepper", "perfect", "pests", "petals", "phase", "pheasants",
            "phone", "phrases", "physics", "piano", "picked", "pierce", "pigment", "piloted",
            "pimple", "pinched", "pioneer", "pipeline", "pirate", "pistons", "pitched", "pivot",
            "pixels", "pizza", "playful", "pledge", "pliers", "plotting", "plus", "plywood",
            "poaching", "pockets", "podcast", "poetry", "point", "poker", "polar", "ponies",
            "pool", "popular", "portents", "possible", "potato", "pouch", "poverty", "powder",
            "pram", "present", "pride", "problems", "pruned", "prying", "psychic", "public",
            "puck", "puddle", "puffin", "pulp", "pumpkins", "punch", "puppy", "purged",
            "push", "putty", "puzzled", "pylons", "pyramid", "python", "queen", "quick",
            "quote", "rabbits", "racetrack", "radar", "rafts", "rage", "railway", "raking",
            "rally", "ramped", "randomly", "rapid", "rarest", "rash", "rated", "ravine",
            "rays", "razor", "react", "rebel", "recipe", "reduce", "reef", "refer",
            "regular", "reheat", "reinvest", "rejoices", "rekindle", "relic", "remedy", "renting",
            "reorder", "repent", "request", "reruns", "rest", "return", "reunion", "revamp",
            "rewind", "rhino", "rhythm", "ribbon", "richly", "ridges", "rift", "rigid",
            "rims", "ringing", "riots", "ripped", "rising", "ritual", "river", "roared",
            "robot", "rockets", "rodent", "rogue", "roles", "romance", "roomy", "roped",
            "roster", "rotate", "rounded", "rover", "rowboat", "royal", "ruby", "rudely",
            "ruffled", "rugged", "ruined", "ruling", "rumble", "runway", "rural", "rustled",
            "ruthless", "sabotage", "sack", "sadness", "safety", "saga", "sailor", "sake"
        };
    }

    const WordList& Dictionary::Words() noexcept {
        return WORDS;
    }

    std::string_view Dictionary::WordAt(const uint16_t index) noexcept {
        return WORDS[index % WORDS.size()];
    }

    Result<uint16_t, KernelFailure> Dictionary::IndexOf(const std::string_view word) {
        const auto prefix = Prefix(word);
        if (prefix.size() == SeedConstants::DICTIONARY_UNIQUE_PREFIX) {
            for (size_t i = 0; i < WORDS.size(); ++i) {
                if (Prefix(WORDS[i]) == prefix) {
                    return Result<uint16_t, KernelFailure>::Ok(static_cast<uint16_t>(i));
                }
            }
        }
        return Result<uint16_t, KernelFailure>::Err(
            KernelFailure::WordNotFound(fmt::format("word '{}' not found in dictionary", word)));
    }

    std::string_view Dictionary::Prefix(const std::string_view word) noexcept {
        return word.substr(0, SeedConstants::DICTIONARY_UNIQUE_PREFIX);
    }
}
