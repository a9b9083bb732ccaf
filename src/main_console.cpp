#include <algorithm>
#include <cctype>
#include <chrono>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "controller/GameController.hpp"
#include "core/Board.hpp"
#include "core/Dictionary.hpp"
#include "core/GameConfig.hpp"
#include "core/GameState.hpp"
#include "core/RandomSource.hpp"
#include "core/Types.hpp"
#include "quiz/DefinitionSource.hpp"
#include "quiz/QuizBuilder.hpp"
#include "quiz/WordFilter.hpp"
#include "session/SessionAutosave.hpp"
#include "session/SessionStore.hpp"

using namespace letterfall::core;
using letterfall::controller::GameController;
using letterfall::controller::InputAction;

namespace {

const char* statusName(GameStatus status) {
    switch (status) {
    case GameStatus::Playing:  return "Playing";
    case GameStatus::Paused:   return "Paused";
    case GameStatus::Quiz:     return "Quiz";
    case GameStatus::GameOver: return "GameOver";
    }
    return "?";
}

std::string pieceLetters(const std::optional<Piece>& piece) {
    if (!piece) return "-";
    return std::string(piece->letters().begin(), piece->letters().end());
}

// Render the locked letters, with the active piece in lower case
void printGame(const GameState& game) {
    const Board& board = game.board();
    const int rows = board.rows();
    const int cols = board.cols();

    std::vector<std::string> lines(rows, std::string(cols, '.'));
    for (int r = 0; r < rows; ++r) {
        for (int c = 0; c < cols; ++c) {
            if (const auto letter = board.cell(r, c)) {
                lines[r][c] = *letter;
            }
        }
    }

    if (const auto& piece = game.activePiece()) {
        const auto& cells = piece->cells();
        for (std::size_t i = 0; i < cells.size(); ++i) {
            const auto& p = cells[i];
            if (board.isInside(p.row, p.col)) {
                lines[p.row][p.col] = static_cast<char>(std::tolower(
                    static_cast<unsigned char>(piece->letters()[i])));
            }
        }
    }

    std::cout << "\n==== LETTERFALL ====\n";
    std::cout << "Score: " << game.score()
              << " | Level: " << game.level()
              << " | Min word: " << game.minWordLength()
              << (game.noRepeatsActive() ? " (no repeats)" : "")
              << " | Status: " << statusName(game.status()) << '\n';
    std::cout << "Next: " << pieceLetters(game.nextPiece())
              << " | Hold: " << pieceLetters(game.heldPiece())
              << " | Combo: x" << game.combo().multiplier() << '\n';

    std::cout << '+' << std::string(cols, '-') << "+\n";
    for (int r = 0; r < rows; ++r) {
        std::cout << '|' << lines[r] << "|\n";
    }
    std::cout << '+' << std::string(cols, '-') << "+\n";

    if (!game.recentWords().empty()) {
        std::cout << "Recent:";
        for (const auto& w : game.recentWords()) std::cout << ' ' << w;
        std::cout << '\n';
    }

    std::cout << "Commands:\n"
              << "  a = left, d = right, w = rotate, s = soft drop\n"
              << "  h = hard drop, c = hold, g = gravity tick\n"
              << "  p = pause/resume, r = restart, q = quit\n";
}

void reportEvents(GameState& game) {
    for (const auto& e : game.drainEvents()) {
        switch (e.kind) {
        case GameEventKind::WordsCleared:
            std::cout << "Cleared:";
            for (const auto& w : e.words) std::cout << ' ' << w;
            std::cout << " (+" << e.value << ")\n";
            break;
        case GameEventKind::BigClear:
            std::cout << "Big clear!\n";
            break;
        case GameEventKind::LevelUp:
            std::cout << "Level " << e.value << "!\n";
            break;
        case GameEventKind::QuizCorrect:
            std::cout << "Correct! +" << e.value << '\n';
            break;
        case GameEventKind::QuizWrong:
            std::cout << "Wrong: the floor rises.\n";
            break;
        case GameEventKind::GameOver:
            std::cout << "Final score: " << e.value << '\n';
            break;
        case GameEventKind::PieceLocked:
        case GameEventKind::QuizRequested:
            break;
        }
    }
}

// Blocks on stdin until the player answers or skips
QuizOutcome runQuiz(letterfall::quiz::QuizBuilder& builder, const std::string& word) {
    const auto card = builder.build(word);

    std::cout << "\n==== QUIZ: what does " << card.word << " mean? ====\n";
    for (std::size_t i = 0; i < card.choices.size(); ++i) {
        std::cout << "  " << (i + 1) << ") " << card.choices[i] << '\n';
    }
    std::cout << "Answer 1-" << card.choices.size() << " (anything else skips): ";

    std::string line;
    if (!std::getline(std::cin, line) || line.empty()) {
        return card.judge(std::nullopt);
    }
    const char c = line[0];
    if (c < '1' || c > static_cast<char>('0' + card.choices.size())) {
        return card.judge(std::nullopt);
    }
    const auto outcome = card.judge(static_cast<std::size_t>(c - '1'));
    if (outcome != QuizOutcome::Correct) {
        std::cout << "It was: " << card.correctChoice() << '\n';
    }
    return outcome;
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2 || argc > 5) {
        std::cerr << "Usage: " << argv[0]
                  << " <player_name> [data_dir] [casual|standard|hard|insane] [starting_level]\n"
                  << "  data_dir holds words.txt, definitions.tsv, banned_words.txt\n"
                  << "  and receives session.txt\n";
        return 1;
    }

    GameConfig config;
    config.playerName = argv[1];
    const std::string dataDir = argc >= 3 ? argv[2] : "data";
    if (argc >= 4) config.difficulty = parseDifficulty(argv[3]);
    if (argc >= 5) {
        try {
            config.startingLevel = std::stoi(argv[4]);
        } catch (const std::logic_error&) {
            std::cerr << "Invalid starting level '" << argv[4] << "', using 1\n";
        }
    }

    const WordSet words = WordSet::loadFromFile(dataDir + "/words.txt");
    const auto definitions = letterfall::quiz::DefinitionTable::loadFromFile(dataDir + "/definitions.tsv");
    const auto filter = letterfall::quiz::WordFilter::loadFromFile(dataDir + "/banned_words.txt");
    std::cout << "Loaded " << words.size() << " words, "
              << definitions.size() << " definitions.\n";

    MersenneRandomSource random;
    GameState game{config, words, random};
    GameController controller{game};
    letterfall::quiz::QuizBuilder quizBuilder{definitions, filter, random, words};

    letterfall::session::FileSessionStore store{dataDir + "/session.txt"};
    letterfall::session::SessionAutosave autosave{store};

    using SysClock = std::chrono::system_clock;
    const auto status = autosave.restoreInto(game, config.playerName, SysClock::now());
    if (status == letterfall::session::RestoreStatus::Restored) {
        std::cout << "Resumed your last game. Press 'p' to continue.\n";
    }

    std::string cmd;
    printGame(game);

    while (true) {
        if (game.status() == GameStatus::Quiz && game.pendingQuizWord()) {
            game.answerQuiz(runQuiz(quizBuilder, *game.pendingQuizWord()));
            reportEvents(game);
            printGame(game);
            continue;
        }

        std::cout << "\nEnter command: ";
        if (!std::getline(std::cin, cmd)) {
            break; // EOF
        }
        if (cmd.empty()) {
            continue;
        }

        char c = cmd[0];
        if (c == 'q' || c == 'Q') {
            autosave.saveNow(game, config.playerName, SysClock::now());
            std::cout << "Quitting.\n";
            break;
        }

        switch (c) {
        case 'a': case 'A':
            controller.handleAction(InputAction::MoveLeft);
            break;
        case 'd': case 'D':
            controller.handleAction(InputAction::MoveRight);
            break;
        case 's': case 'S':
            game.softDrop();
            break;
        case 'w': case 'W':
            controller.handleAction(InputAction::Rotate);
            break;
        case 'h': case 'H':
            controller.handleAction(InputAction::HardDrop);
            break;
        case 'c': case 'C':
            controller.handleAction(InputAction::Hold);
            break;
        case 'g': case 'G': {
            // Feed whole frames until one gravity interval has elapsed
            int remaining = game.gravityIntervalMs();
            while (remaining > 0) {
                const int step = std::min(remaining, config.maxFrameDeltaMs);
                controller.update(GameController::Duration{step});
                remaining -= step;
            }
            break;
        }
        case 'p': case 'P':
            controller.handleAction(InputAction::PauseResume);
            break;
        case 'r': case 'R':
            game.restart();
            controller.resetTiming();
            autosave.onRestart(game);
            break;
        default:
            std::cout << "Unknown command: " << c << '\n';
            break;
        }

        reportEvents(game);
        autosave.update(game, config.playerName, SysClock::now());
        printGame(game);

        if (game.status() == GameStatus::GameOver) {
            autosave.saveNow(game, config.playerName, SysClock::now());
            std::cout << "GAME OVER. Press 'r' to restart or 'q' to quit.\n";
        }
    }

    return 0;
}
